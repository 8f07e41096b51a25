// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "crypto/IdentityProvider.h"
#include "crypto/SecretKey.h"
#include "main/Application.h"
#include "main/ApplicationUtils.h"
#include "main/Config.h"
#include "main/ProxyVersion.h"
#include "proxy/AdmissionController.h"
#include "util/Logging.h"
#include "util/Timer.h"

#include <sodium.h>

#include <algorithm>
#include <clara.hpp>
#include <fmt/format.h>
#include <functional>
#include <iostream>
#include <map>

namespace tpuproxy
{

void
writeWithTextFlow(std::ostream& os, std::string const& text)
{
    os << clara::TextFlow::Column(text).width(
              CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH)
       << "\n\n";
}

namespace
{

char const* const DEFAULT_CONFIG_FILE = "tpu-forward-proxy.toml";

// Options that may also appear before the command name, and whether each one
// takes a value.
std::map<std::string, bool> const LEADING_OPTIONS{{"--conf", true},
                                                  {"--ll", true},
                                                  {"--identity-keypair", true},
                                                  {"--help", false}};

struct Subcommand
{
    std::string mName;
    std::string mDescription;
    std::function<int(CommandLineArgs const&)> mRun;
};

struct ConfigOptions
{
    LogLevel mLogLevel{LogLevel::LVL_INFO};
    std::string mConfigFile;

    Config
    load() const
    {
        auto file = mConfigFile.empty() ? std::string(DEFAULT_CONFIG_FILE)
                                        : mConfigFile;
        Logging::setLogLevel(mLogLevel, nullptr);
        CLOG_INFO(Main, "Config from {}", file);
        Config cfg;
        cfg.load(file);
        return cfg;
    }
};

clara::Opt
logLevelOpt(LogLevel& level)
{
    return clara::Opt{[&level](std::string const& arg) {
                          level = Logging::getLLfromString(arg);
                      },
                      "LEVEL"}["--ll"]("set the log level");
}

clara::Opt
configFileOpt(std::string& file)
{
    return clara::Opt{file, "FILE-NAME"}["--conf"](fmt::format(
        FMT_STRING("config file ('{}' for STDIN, default '{}')"),
        Config::STDIN_SPECIAL_NAME, DEFAULT_CONFIG_FILE));
}

clara::Opt
keypairFileOpt(std::string& file)
{
    return clara::Opt{file, "FILE-NAME"}["--identity-keypair"](
        "JSON byte array holding the 64 byte identity keypair; overrides "
        "IDENTITY_KEYPAIR_FILE");
}

// Parses the command's arguments with `parser` plus --help, then calls `f`.
int
parseAndRun(CommandLineArgs const& args, clara::Parser parser,
            std::function<int()> const& f)
{
    bool help = false;
    parser |= clara::Help(help);
    auto result = parser.parse(
        args.mCommandName,
        clara::detail::TokenStream{args.mArgs.begin(), args.mArgs.end()});
    if (!result)
    {
        writeWithTextFlow(std::cerr, result.errorMessage());
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        parser.writeToStream(std::cerr);
        return 1;
    }
    if (help)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        parser.writeToStream(std::cout);
        return 0;
    }
    return f();
}

int
genKeypair(CommandLineArgs const& args)
{
    return parseAndRun(args, clara::Parser{}, [] {
        std::cout << SecretKey::random().toJsonKeypair() << std::endl;
        return 0;
    });
}

int
printIdentity(CommandLineArgs const& args)
{
    ConfigOptions opts;
    std::string keypairFile;
    auto parser = clara::Parser{} | logLevelOpt(opts.mLogLevel) |
                  configFileOpt(opts.mConfigFile) |
                  keypairFileOpt(keypairFile);
    return parseAndRun(args, parser, [&] {
        if (keypairFile.empty() && !opts.mConfigFile.empty())
        {
            keypairFile = opts.load().IDENTITY_KEYPAIR_FILE;
        }
        auto key = IdentityProvider::loadIdentity(keypairFile);
        std::cout << key.getPublicKeyBase58() << std::endl;
        return 0;
    });
}

int
checkConfig(CommandLineArgs const& args)
{
    ConfigOptions opts;
    auto parser = clara::Parser{} | logLevelOpt(opts.mLogLevel) |
                  configFileOpt(opts.mConfigFile);
    return parseAndRun(args, parser, [&] {
        Config cfg;
        try
        {
            cfg = opts.load();
        }
        catch (std::exception const& e)
        {
            std::cerr << "invalid config: " << e.what() << std::endl;
            return 1;
        }
        auto total = cfg.totalStake();
        std::cout << fmt::format(FMT_STRING("{} destination(s), total stake "
                                            "{}"),
                                 cfg.DESTINATIONS.size(), total)
                  << std::endl;
        for (auto const& d : cfg.DESTINATIONS)
        {
            std::cout << fmt::format(
                             FMT_STRING("  {:<16} {:<40} stake {:>20} "
                                        "quota {}"),
                             d.mName, d.toString(), d.mStake,
                             AdmissionController::computeStreamQuota(cfg, d,
                                                                     total))
                      << std::endl;
        }
        return 0;
    });
}

int
runProxy(CommandLineArgs const& args)
{
    ConfigOptions opts;
    std::string keypairFile;
    auto parser = clara::Parser{} | logLevelOpt(opts.mLogLevel) |
                  configFileOpt(opts.mConfigFile) |
                  keypairFileOpt(keypairFile);
    return parseAndRun(args, parser, [&] {
        VirtualClock clock(VirtualClock::REAL_TIME);
        Application::pointer app;
        try
        {
            auto cfg = opts.load();
            if (!keypairFile.empty())
            {
                cfg.IDENTITY_KEYPAIR_FILE = keypairFile;
            }
            app = Application::create(clock, cfg);
        }
        catch (std::exception const& e)
        {
            CLOG_FATAL(Main, "Could not start: {}", e.what());
            return 1;
        }
        // Outside of the try block so that crashes are reported as such.
        return runApp(app);
    });
}

int
printVersion(CommandLineArgs const& args)
{
    return parseAndRun(args, clara::Parser{}, [] {
        std::cout << TPU_FORWARD_PROXY_VERSION << std::endl;
        std::cout << "libsodium version: " << sodium_version_string()
                  << std::endl;
        return 0;
    });
}

void
printUsage(std::string const& exeName, std::vector<Subcommand> const& cmds,
           std::ostream& os)
{
    os << "usage:\n  " << exeName << " COMMAND [OPTIONS]\n\n"
       << "where COMMAND is one of following:" << std::endl;

    size_t width = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    size_t nameWidth = 0;
    for (auto const& c : cmds)
    {
        nameWidth = std::max(nameWidth, c.mName.size() + 2);
    }
    nameWidth = std::min(nameWidth, width / 2);
    for (auto const& c : cmds)
    {
        os << (clara::TextFlow::Column(c.mName).width(nameWidth).indent(2) +
               clara::TextFlow::Spacer(4) +
               clara::TextFlow::Column(c.mDescription)
                   .width(width - 7 - nameWidth))
           << std::endl;
    }
}

// Splits argv into the command name and the arguments handed to it. Known
// options may precede the command name. Returns an empty name when there is
// no command or an unknown option comes first.
std::pair<std::string, std::vector<std::string>>
splitCommandLine(int argc, char* const* argv)
{
    std::string command;
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i)
    {
        std::string token = argv[i];
        if (!command.empty() || token.empty() || token[0] != '-')
        {
            if (command.empty())
            {
                command = token;
            }
            else
            {
                rest.emplace_back(token);
            }
            continue;
        }
        auto opt = LEADING_OPTIONS.find(token);
        if (opt == LEADING_OPTIONS.end())
        {
            return {};
        }
        rest.emplace_back(token);
        if (opt->second && i + 1 < argc)
        {
            rest.emplace_back(argv[++i]);
        }
    }
    return {command, rest};
}
}

int
handleCommandLine(int argc, char* const* argv)
{
    std::string const exeName = "tpu-forward-proxy";
    std::vector<Subcommand> commands{
        {"check-config",
         "load and validate a config, then print the destinations and their "
         "stream quotas",
         checkConfig},
        {"gen-keypair", "generate and print a random identity keypair",
         genKeypair},
        {"print-identity",
         "print the base58 public key of the configured identity",
         printIdentity},
        {"run", "run the forwarding proxy", runProxy},
        {"version", "print version information", printVersion}};
    commands.push_back(
        {"help", "display list of available commands",
         [&](CommandLineArgs const&) {
             printUsage(exeName, commands, std::cout);
             return 0;
         }});

    auto split = splitCommandLine(argc, argv);
    auto it = std::find_if(
        commands.begin(), commands.end(),
        [&](Subcommand const& c) { return c.mName == split.first; });
    if (it == commands.end())
    {
        printUsage(exeName, commands, std::cerr);
        return 1;
    }

    CommandLineArgs args{exeName,
                         fmt::format(FMT_STRING("{} {}"), exeName, it->mName),
                         it->mDescription, split.second};
    if (it->mName == "run")
    {
        // Crashes while running are not turned into an exit status.
        return it->mRun(args);
    }
    try
    {
        return it->mRun(args);
    }
    catch (std::exception const& e)
    {
        CLOG_FATAL(Main, "Got an exception: {}", e.what());
        return 1;
    }
}
}
