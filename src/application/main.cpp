// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_dispatcher.h"
#include "event_bus.h"
#include "live_loop.h"
#include "lvgl_log_handler.h"
#include "lvgl_scheduler.h"
#include "pointer_id_allocator.h"
#include "profile_config.h"
#include "replay_driver.h"
#include "task_scheduler.h"
#include "touch_event.h"
#include "widget_manager.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <getopt.h>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace touchstick;

namespace {

struct Options {
    std::string profile_path;
    std::string replay_path;
    std::string save_profile_path;
    bool live = false;
    int verbosity = 0;
};

void print_usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [options] (--replay <script> | --live)\n"
                 "\n"
                 "  -p, --profile <file>       widget layout and calibration (JSON)\n"
                 "  -r, --replay <file>        play a timestamped command script\n"
                 "  -l, --live                 read JSON commands from stdin\n"
                 "  -s, --save-profile <file>  write the profile back after the run\n"
                 "  -v, --verbose              more logging (repeat up to -vvv)\n"
                 "  -h, --help                 this help\n"
                 "\n"
                 "Touch events are written to stdout as JSON lines.\n",
                 argv0);
}

/// @return false on a usage error
bool parse_options(int argc, char** argv, Options& opts) {
    static const option long_options[] = {
        {"profile", required_argument, nullptr, 'p'},
        {"replay", required_argument, nullptr, 'r'},
        {"live", no_argument, nullptr, 'l'},
        {"save-profile", required_argument, nullptr, 's'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "p:r:ls:vh", long_options, nullptr)) != -1) {
        switch (c) {
        case 'p':
            opts.profile_path = optarg;
            break;
        case 'r':
            opts.replay_path = optarg;
            break;
        case 'l':
            opts.live = true;
            break;
        case 's':
            opts.save_profile_path = optarg;
            break;
        case 'v':
            ++opts.verbosity;
            break;
        case 'h':
        default:
            return false;
        }
    }
    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        return false;
    }
    if (opts.live == !opts.replay_path.empty()) {
        std::fprintf(stderr, "Exactly one of --replay or --live is required\n");
        return false;
    }
    return true;
}

/// One click-to-walk stick bottom left, one skill button bottom right
Profile default_profile() {
    Profile profile;
    WidgetProfileEntry walk;
    walk.id = 1;
    walk.type = "walk_joystick";
    walk.geometry = {{320.0, 800.0}, 120.0};
    WidgetProfileEntry skill;
    skill.id = 2;
    skill.type = "skill_cast";
    skill.geometry = {{1600.0, 820.0}, 75.0};
    profile.widgets = {walk, skill};
    return profile;
}

uint32_t tick_ms() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

bool finish_profile(const Options& opts, const WidgetManager& widgets) {
    if (opts.save_profile_path.empty()) {
        return true;
    }
    return save_profile(opts.save_profile_path, widgets.snapshot());
}

int run_replay(const Options& opts, const Profile& profile, TouchEmitter& emitter,
               PointerIdAllocator& pointer_ids) {
    auto script = load_replay_script(opts.replay_path);
    if (!script) {
        return 1;
    }

    ManualScheduler scheduler;
    EventBus bus;
    WidgetContext ctx{scheduler, bus, pointer_ids, emitter, profile.surface};
    WidgetManager widgets(ctx);
    widgets.load(profile);
    CommandDispatcher dispatcher(widgets, bus);

    ReplayDriver driver(scheduler, dispatcher);
    auto stats = driver.run(*script);
    if (!stats) {
        return 1;
    }
    return finish_profile(opts, widgets) ? 0 : 1;
}

int run_live(const Options& opts, const Profile& profile, TouchEmitter& emitter,
             PointerIdAllocator& pointer_ids) {
    lv_init();
    lv_tick_set_cb(tick_ms);
    logging::register_lvgl_log_handler();

    int rc = 0;
    {
        LvglScheduler scheduler;
        EventBus bus;
        WidgetContext ctx{scheduler, bus, pointer_ids, emitter, profile.surface};
        WidgetManager widgets(ctx);
        widgets.load(profile);
        CommandDispatcher dispatcher(widgets, bus);

        LiveLoop loop(dispatcher, widgets, STDIN_FILENO);
        rc = loop.run();
        if (!finish_profile(opts, widgets)) {
            rc = 1;
        }
    }

    lv_deinit();
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }
    logging::init_logging(opts.verbosity);

    Profile profile;
    if (opts.profile_path.empty()) {
        spdlog::info("[Main] No profile given, using the default layout");
        profile = default_profile();
    } else {
        auto loaded = load_profile(opts.profile_path);
        if (!loaded) {
            spdlog::error("[Main] Could not load profile {}", opts.profile_path);
            return 1;
        }
        profile = std::move(*loaded);
    }

    JsonLinesTouchSink sink(std::cout);
    PointerIdAllocator pointer_ids;
    TouchEmitter emitter(sink, pointer_ids, profile.surface);

    int rc = opts.live ? run_live(opts, profile, emitter, pointer_ids)
                       : run_replay(opts, profile, emitter, pointer_ids);
    spdlog::info("[Main] {} touch events emitted", emitter.emitted_count());
    return rc;
}
