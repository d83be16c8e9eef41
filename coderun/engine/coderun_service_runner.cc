/* coderun_service_runner.cc                                       -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Code execution service speaking JSON frames, one per line, over its
   standard input and output.
*/

#include <signal.h>

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <boost/program_options/cmdline.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "coderun/service/logs.h"
#include "coderun/service/runner.h"
#include "coderun/types/json.h"
#include "coderun/engine/engine_config.h"
#include "coderun/engine/execution_engine.h"
#include "coderun/engine/execution_session.h"


using namespace std;
using namespace Coderun;


namespace {

Logging::Category logs("Coderun Service");

} // file scope


int main(int argc, char ** argv)
{
    using namespace boost::program_options;

    EngineConfig config;
    config.loadFromEnvironment();

    string configFile;
    string runnerHelper;
    string logFormat = "console";
    vector<string> interpreter;
    bool verbose = false;

    options_description configuration_options("Configuration options");
    configuration_options.add_options()
        ("config,c", value<string>(&configFile),
         "JSON file with the engine configuration")
        ("execution-timeout,t", value<double>(),
         "Seconds an execution may run before being terminated")
        ("max-code-length,m", value<int>(),
         "Maximum number of characters of a submission")
        ("strategy,s", value<string>(),
         "Execution strategy: subprocess or delegated")
        ("interpreter,i", value<vector<string> >(&interpreter)->multitoken(),
         "Interpreter command line; the code file is appended to it")
        ("workers,w", value<int>(),
         "Worker threads of the delegated strategy")
        ("runner-helper", value<string>(&runnerHelper),
         "Path of the runner_helper executable")
        ("log-format", value<string>(&logFormat)->default_value("console"),
         "Format of the logs written to stderr: console or json")
        ("verbose,v", bool_switch(&verbose),
         "Enable every log category");

    options_description all_opt;
    all_opt.add(configuration_options);
    all_opt.add_options()
        ("help,h", "print this message");

    variables_map vm;
    store(command_line_parser(argc, argv)
          .options(all_opt)
          .run(),
          vm);
    notify(vm);

    if (vm.count("help")) {
        cerr << all_opt << endl;
        exit(1);
    }

    Logging::Category::writeAllTo(logFormat);
    if (verbose) {
        Logging::Category::root().activate();
    }

    if (!configFile.empty())
        config.loadFromFile(configFile);
    if (vm.count("execution-timeout"))
        config.executionTimeout = vm["execution-timeout"].as<double>();
    if (vm.count("max-code-length"))
        config.maxCodeLength = vm["max-code-length"].as<int>();
    if (vm.count("strategy"))
        config.strategy = vm["strategy"].as<string>();
    if (!interpreter.empty())
        config.interpreter = interpreter;
    if (vm.count("workers"))
        config.workers = vm["workers"].as<int>();
    if (!runnerHelper.empty())
        Runner::runnerHelper = runnerHelper;

    config.validate();

    /* A client going away must not kill the service. */
    ::signal(SIGPIPE, SIG_IGN);

    LOG(logs) << "starting with configuration " << printJson(config.toJson())
              << endl;

    ExecutionEngine engine(config);

    std::mutex outputLock;
    auto send = [&] (const string & frame) {
        std::unique_lock<std::mutex> guard(outputLock);
        cout << frame << endl;
        if (!cout) {
            throw Coderun::Exception("could not write to standard output");
        }
    };

    ExecutionSession session(engine, send, config.maxCodeLength);

    string line;
    while (getline(cin, line)) {
        if (line.find_first_not_of(" \t\r") == string::npos)
            continue;
        session.handleFrame(line);
    }

    LOG(logs) << "end of input, waiting for "
              << session.activeExecutions().size()
              << " executions to finish" << endl;

    engine.waitUntilIdle();
    session.close();
    engine.shutdown();

    return 0;
}
