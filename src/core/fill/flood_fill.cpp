#include "core/fill/flood_fill.h"

#include <deque>
#include <utility>
#include <vector>

namespace rustique
{
bool PaintBucket(IPaintTarget& target, int seed_x, int seed_y, const Cell& fill)
{
    const int w = target.GetWidth();
    const int h = target.GetHeight();
    if (seed_x < 0 || seed_y < 0 || seed_x >= w || seed_y >= h)
        return false;

    const Cell match = target.GetTargetCell(seed_x, seed_y);
    if (match == fill)
        return false;

    auto index_of = [w](int x, int y) { return (size_t)y * (size_t)w + (size_t)x; };

    std::vector<bool> visited((size_t)w * (size_t)h, false);
    std::deque<std::pair<int, int>> queue;
    queue.emplace_back(seed_x, seed_y);
    visited[index_of(seed_x, seed_y)] = true;

    bool wrote = false;
    while (!queue.empty())
    {
        const auto [x, y] = queue.front();
        queue.pop_front();

        // A cell can be enqueued before an earlier write changed it.
        if (target.GetTargetCell(x, y) != match)
            continue;

        target.RecordChange(x, y, fill);
        wrote = true;

        static constexpr int kNeighbours[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
        for (const auto& d : kNeighbours)
        {
            const int nx = x + d[0];
            const int ny = y + d[1];
            if (nx < 0 || ny < 0 || nx >= w || ny >= h)
                continue;
            const size_t ni = index_of(nx, ny);
            if (visited[ni])
                continue;
            if (target.GetTargetCell(nx, ny) != match)
                continue;
            visited[ni] = true;
            queue.emplace_back(nx, ny);
        }
    }
    return wrote;
}
} // namespace rustique
