#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "core/monitor_layout.h"

using namespace spanwall::core;

namespace {

MonitorSpec fhd_24()
{
        return {1920, 1080, 1.0, 24.0, 16, 9, 0.0};
}

std::vector<MonitorSpec> three_monitors()
{
        return {
                {1920, 1080, 1.25, 15.6, 16, 9, 0.1},
                {3840, 2160, 1.5, 32.0, 16, 9, 0.0},
                {2560, 1440, 1.25, 27.0, 16, 9, 0.75},
        };
}

} // namespace

TEST_CASE("Monitor geometry follows diagonal and aspect ratio", "[layout][geometry]")
{
        MonitorGeometry g;
        Error error;
        REQUIRE(compute_monitor_geometry(fhd_24(), g, error));

        CHECK(g.width_in * g.width_in + g.height_in * g.height_in == Approx(24.0 * 24.0));
        CHECK(g.width_in / g.height_in == Approx(16.0 / 9.0));
        CHECK(g.width_in == Approx(24.0 * 16.0 / std::sqrt(337.0)));
        CHECK(g.width_scaled_px == 1920);
        CHECK(g.height_scaled_px == 1080);

        SECTION("Non 16:9 panel")
        {
                MonitorSpec spec{2560, 1080, 1.0, 34.0, 21, 9, 0.0};
                REQUIRE(compute_monitor_geometry(spec, g, error));
                CHECK(std::hypot(g.width_in, g.height_in) == Approx(34.0));
                CHECK(g.width_in / g.height_in == Approx(21.0 / 9.0));
        }

        SECTION("Scaling shrinks the logical footprint")
        {
                MonitorSpec spec{3840, 2160, 1.5, 32.0, 16, 9, 0.0};
                REQUIRE(compute_monitor_geometry(spec, g, error));
                CHECK(g.width_scaled_px == 2560);
                CHECK(g.height_scaled_px == 1440);
        }

        SECTION("Footprint is rounded to nearest")
        {
                MonitorSpec spec{1366, 768, 1.75, 14.0, 16, 9, 0.0};
                REQUIRE(compute_monitor_geometry(spec, g, error));
                CHECK(g.width_scaled_px == 781);  // 780.57
                CHECK(g.height_scaled_px == 439); // 438.86
        }
}

TEST_CASE("Layout totals", "[layout]")
{
        Layout layout;
        Error error;
        const std::vector<MonitorSpec> monitors = three_monitors();
        const std::vector<double> gaps = {0.4, 0.5};
        REQUIRE(compute_layout(monitors, gaps, layout, error));

        REQUIRE(layout.geometry.size() == 3);
        double width_sum = 0.0;
        double tallest = 0.0;
        int pixel_sum = 0;
        int pixel_height = 0;
        for (size_t i = 0; i < monitors.size(); ++i) {
                width_sum += layout.geometry[i].width_in;
                tallest = std::max(tallest, layout.geometry[i].height_in + monitors[i].offset_bottom_in);
                pixel_sum += static_cast<int>(std::lround(monitors[i].width_px / monitors[i].scaling));
                pixel_height = std::max(pixel_height, layout.geometry[i].height_scaled_px);
        }

        CHECK(layout.total_width_in == Approx(width_sum + 0.9));
        CHECK(layout.max_height_in == Approx(tallest));
        CHECK(layout.total_output_width_px == pixel_sum);
        CHECK(layout.total_output_width_px == 1536 + 2560 + 2048);
        CHECK(layout.output_height_px == pixel_height);
        CHECK(layout.output_height_px == 1440);
        CHECK(layout.aspect() == Approx(layout.total_width_in / layout.max_height_in));
}

TEST_CASE("Output width sums per-monitor rounding", "[layout]")
{
        // 1001/2 = 500.5 and 1003/2 = 501.5: rounding the sum (1002) would differ.
        const std::vector<MonitorSpec> monitors = {
                {1001, 600, 2.0, 20.0, 16, 10, 0.0},
                {1003, 600, 2.0, 20.0, 16, 10, 0.0},
        };
        Layout layout;
        Error error;
        REQUIRE(compute_layout(monitors, {0.0}, layout, error));
        CHECK(layout.geometry[0].width_scaled_px == 501);
        CHECK(layout.geometry[1].width_scaled_px == 502);
        CHECK(layout.total_output_width_px == 1003);
}

TEST_CASE("Layout configuration errors", "[layout][errors]")
{
        Layout layout;
        Error error;

        SECTION("Gap count must be monitor count minus one")
        {
                CHECK_FALSE(compute_layout(three_monitors(), {0.4}, layout, error));
                CHECK(error.kind == ErrorKind::Config);
                CHECK_FALSE(compute_layout(three_monitors(), {0.4, 0.5, 0.6}, layout, error));
                CHECK(error.kind == ErrorKind::Config);
                CHECK_FALSE(compute_layout({fhd_24()}, {0.1}, layout, error));
                CHECK(error.kind == ErrorKind::Config);
        }

        SECTION("No monitors")
        {
                CHECK_FALSE(compute_layout({}, {}, layout, error));
                CHECK(error.kind == ErrorKind::Config);
        }

        SECTION("Non-positive monitor fields")
        {
                std::vector<MonitorSpec> bad(5, fhd_24());
                bad[0].width_px = 0;
                bad[1].scaling = 0.0;
                bad[2].diagonal_in = -1.0;
                bad[3].aspect_h = 0;
                bad[4].offset_bottom_in = -0.5;
                for (const MonitorSpec& spec : bad) {
                        error = Error{};
                        CHECK_FALSE(compute_layout({spec}, {}, layout, error));
                        CHECK(error.kind == ErrorKind::Config);
                        CHECK(error.message.find("monitor 1") != std::string::npos);
                }
        }

        SECTION("Negative gap")
        {
                CHECK_FALSE(compute_layout({fhd_24(), fhd_24()}, {-0.1}, layout, error));
                CHECK(error.kind == ErrorKind::Config);
        }

        SECTION("Degenerate layout cannot be normalized")
        {
                Layout degenerate;
                MonitorGeometry g;
                NormalizedRect rect;
                CHECK_FALSE(compute_monitor_sample_region(fhd_24(), g, degenerate, 0.0, rect, error));
                CHECK(error.kind == ErrorKind::Config);
        }
}

TEST_CASE("Sample regions", "[layout][sampling]")
{
        Error error;

        SECTION("Single monitor covers the whole layout")
        {
                Layout layout;
                REQUIRE(compute_layout({fhd_24()}, {}, layout, error));
                std::vector<MonitorSlice> slices;
                REQUIRE(compute_monitor_slices(layout, slices, error));
                REQUIRE(slices.size() == 1);
                CHECK(slices[0].sample.left == Approx(0.0));
                CHECK(slices[0].sample.right == Approx(1.0));
                CHECK(slices[0].sample.top == Approx(0.0).margin(1e-12));
                CHECK(slices[0].sample.bottom == Approx(1.0));
                CHECK(slices[0].placement.x == 0);
                CHECK(slices[0].placement.y == 0);
                CHECK(slices[0].placement.width == 1920);
                CHECK(slices[0].placement.height == 1080);
        }

        SECTION("Adjacent monitors without gaps are contiguous")
        {
                Layout layout;
                REQUIRE(compute_layout(three_monitors(), {0.0, 0.0}, layout, error));
                std::vector<MonitorSlice> slices;
                REQUIRE(compute_monitor_slices(layout, slices, error));
                REQUIRE(slices.size() == 3);
                CHECK(slices[0].sample.left == Approx(0.0));
                CHECK(slices[0].sample.right == Approx(slices[1].sample.left));
                CHECK(slices[1].sample.right == Approx(slices[2].sample.left));
                CHECK(slices[2].sample.right == Approx(1.0));
        }

        SECTION("Gaps shift sampling but not placement")
        {
                Layout layout;
                REQUIRE(compute_layout(three_monitors(), {0.4, 0.5}, layout, error));
                std::vector<MonitorSlice> slices;
                REQUIRE(compute_monitor_slices(layout, slices, error));
                REQUIRE(slices.size() == 3);

                CHECK(slices[1].sample.left - slices[0].sample.right == Approx(0.4 / layout.total_width_in));
                CHECK(slices[2].sample.left - slices[1].sample.right == Approx(0.5 / layout.total_width_in));
                CHECK(slices[2].sample.right == Approx(1.0));

                CHECK(slices[0].placement.x == 0);
                CHECK(slices[1].placement.x == slices[0].placement.width);
                CHECK(slices[2].placement.x == slices[0].placement.width + slices[1].placement.width);
        }

        SECTION("Vertical band follows bottom offset")
        {
                Layout layout;
                const std::vector<MonitorSpec> monitors = three_monitors();
                REQUIRE(compute_layout(monitors, {0.4, 0.5}, layout, error));
                std::vector<MonitorSlice> slices;
                REQUIRE(compute_monitor_slices(layout, slices, error));

                for (size_t i = 0; i < slices.size(); ++i) {
                        const NormalizedRect& r = slices[i].sample;
                        CHECK(r.bottom == Approx(1.0 - monitors[i].offset_bottom_in / layout.max_height_in));
                        CHECK(r.bottom - r.top == Approx(layout.geometry[i].height_in / layout.max_height_in));
                        CHECK(r.top >= -1e-12);
                        CHECK(r.bottom <= 1.0 + 1e-12);
                        CHECK(slices[i].placement.y
                              == layout.output_height_px - layout.geometry[i].height_scaled_px);
                }
                // The 32" center monitor is the tallest column.
                CHECK(slices[1].sample.top == Approx(0.0).margin(1e-12));
                CHECK(slices[0].sample.top > 0.0);
                CHECK(slices[2].sample.top > 0.0);
        }

        SECTION("Running offset is honoured")
        {
                Layout layout;
                REQUIRE(compute_layout({fhd_24(), fhd_24()}, {2.0}, layout, error));
                NormalizedRect rect;
                const double x = layout.geometry[0].width_in + 2.0;
                REQUIRE(compute_monitor_sample_region(layout.monitors[1], layout.geometry[1], layout, x, rect, error));
                CHECK(rect.left == Approx(x / layout.total_width_in));
                CHECK(rect.right == Approx(1.0));
        }
}

TEST_CASE("Monitor geometry rejects unusable specs on its own", "[layout][geometry][errors]")
{
        MonitorGeometry g;
        g.width_in = -1.0;
        Error error;

        MonitorSpec zero_aspect{1920, 1080, 1.0, 24.0, 0, 0, 0.0};
        CHECK_FALSE(compute_monitor_geometry(zero_aspect, g, error));
        CHECK(error.kind == ErrorKind::Config);
        CHECK(error.message.find("aspect ratio") != std::string::npos);
        CHECK(g.width_in == -1.0);

        MonitorSpec zero_scaling{1920, 1080, 0.0, 24.0, 16, 9, 0.0};
        CHECK_FALSE(compute_monitor_geometry(zero_scaling, g, error));
        CHECK(error.message.find("scaling") != std::string::npos);

        MonitorSpec negative_diagonal{1920, 1080, 1.0, -24.0, 16, 9, 0.0};
        CHECK_FALSE(compute_monitor_geometry(negative_diagonal, g, error));
        CHECK(error.message.find("diagonal") != std::string::npos);
}
