// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/utils/Logger.hpp"
#include "PotentialFlow/utils/Profiler.hpp"
#include "PotentialFlow/utils/Config.hpp"
#include "PotentialFlow/core/Simulation.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace pflow;

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <path_to_config.json>" << std::endl;
        return -1;
    }
    std::string config_filepath = argv[1];

    pflow::Config config;
    if (!config.load(config_filepath))
    {
        std::cerr << "Fatal: Failed to load configuration file." << std::endl;
        return -1;
    }
    const auto &params = config.getParams();

    LOG_INFO("Application starting up.");

    try
    {
        auto simulation = std::make_unique<pflow::Simulation>(params);

        simulation->initialize();

        PROFILE_SESSION("WindTunnel");
        int frame = 0;
        for (int i = 0; i < params.total_steps; ++i)
        {
            if (i % params.output_frequency == 0)
            {
                if (!simulation->saveFrameData(frame))
                {
                    LOG_WARN("Frame {} was not written completely.", frame);
                }
                ++frame;
            }
            simulation->step();
        }
        PROFILE_END_SESSION();

        const auto &evaluator = simulation->evaluator();
        LOG_INFO("Finished {} ticks with the '{}' evaluator ({} primary failures).",
                 simulation->tickCount(), evaluator.activeBackend(), evaluator.totalFailures());
    }
    catch (const std::exception &e)
    {
        LOG_CRITICAL("An unhandled exception occurred: {}", e.what());
        return -1;
    }

    LOG_INFO("Application shutting down gracefully.");
    return 0;
}
