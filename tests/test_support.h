#pragma once

#include "core/canvas.h"
#include "core/colour.h"
#include "core/paint_target.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace rustique::test
{
inline constexpr Rgba8 kRed{255, 0, 0, 255};
inline constexpr Rgba8 kGreen{0, 255, 0, 255};
inline constexpr Rgba8 kBlue{0, 0, 255, 255};

// Writes straight into the active layer without any history.
class CanvasTarget : public IPaintTarget
{
public:
    explicit CanvasTarget(LayeredCanvas& canvas) : m_canvas(canvas) {}

    int  GetWidth() const override { return m_canvas.GetWidth(); }
    int  GetHeight() const override { return m_canvas.GetHeight(); }
    Cell GetTargetCell(int x, int y) const override { return m_canvas.GetActive(x, y); }
    void RecordChange(int x, int y, const Cell& colour) override
    {
        ++writes;
        m_canvas.SetActive(x, y, colour);
    }

    int writes = 0;

private:
    LayeredCanvas& m_canvas;
};

inline int CountPainted(const LayeredCanvas& canvas)
{
    int n = 0;
    for (int y = 0; y < canvas.GetHeight(); ++y)
        for (int x = 0; x < canvas.GetWidth(); ++x)
            n += canvas.GetActive(x, y).has_value() ? 1 : 0;
    return n;
}

// Per-test scratch directory under the system temp dir, removed on destruction.
class ScratchDir
{
public:
    ScratchDir()
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "rustique_";
        name += info ? std::string(info->test_suite_name()) + "_" + info->name() : "test";
        m_path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        std::filesystem::create_directories(m_path, ec);
    }
    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    std::string File(const std::string& name) const { return (m_path / name).string(); }
    const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};
} // namespace rustique::test
