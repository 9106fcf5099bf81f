/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <memory>
#include <clocale>

#include <unistd.h>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libhubtags/Error.hpp"
#include "libhubtags/Logger.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "libhubtags/utility/environment.hpp"
#include "libhubtags/utility/process.hpp"
#include "cli/CLI.hpp"

using namespace hubtags;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libhubtags::Logger::getInstance();

    try {
        auto installationPrefixDir = libhubtags::process::getInstallationPrefixDir();
        auto config = std::make_shared<common::Config>(installationPrefixDir);
        config->hostEnvironment = libhubtags::environment::parseVariables(environ);

        auto args = libhubtags::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libhubtags::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Unexpected %s without error trace: %s")
            % libhubtags::describeExceptionType(e) % e.what();
        logger.log(message, "main", libhubtags::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
