// idlrpcd serves the conformance interfaces of an IDL schema as JSON-RPC 2.0 over stdin/stdout.
#include "idlrpc/internal/BuildInfo.hpp"
#include "idlrpc/ContractModel.hpp"
#include "idlrpc/Dispatcher.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/HandlerRegistry.hpp"
#include "server/ConformanceHandlers.hpp"
#include "server/JSONTransport.hpp"

#include "gflags/gflags.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <stdio.h>

DEFINE_string(idlFile, "", "Path to the IDL schema JSON to serve.");
DEFINE_string(logFile, "idlrpcdLog.txt", "Path and file name of log file.");
DEFINE_bool(debugLogs, false, "Set log output level to debug (verbose).");
DEFINE_bool(traceLogs, false, "Set log output level to trace (very verbose).");
DEFINE_bool(forceASCII, false, "Escape all non-ASCII characters in responses as \\uXXXX.");

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    auto logger = spdlog::basic_logger_mt("file", FLAGS_logFile);
    logger->flush_on(spdlog::level::info);
    if (FLAGS_debugLogs) {
        logger->set_level(spdlog::level::level_enum::debug);
        logger->flush_on(spdlog::level::debug);
    }
    if (FLAGS_traceLogs) {
        logger->set_level(spdlog::level::level_enum::trace);
        logger->flush_on(spdlog::level::trace);
    }
    spdlog::set_default_logger(logger);
    SPDLOG_INFO("idlrpcd version {}, compiled by {} version {}.", idlrpc::kIdlrpcVersion, idlrpc::kIdlrpcCompilerName,
                idlrpc::kIdlrpcCompilerVersion);

    if (FLAGS_idlFile.empty()) {
        SPDLOG_CRITICAL("No IDL file given, use --idlFile.");
        fprintf(stderr, "idlrpcd: no IDL file given, use --idlFile.\n");
        return -1;
    }

    auto errorReporter = std::make_shared<idlrpc::ErrorReporter>();
    std::shared_ptr<const idlrpc::ContractModel> model = idlrpc::ContractModel::parseFile(FLAGS_idlFile,
                                                                                         errorReporter);
    if (!model) {
        fprintf(stderr, "idlrpcd: failed to load IDL file %s.\n", FLAGS_idlFile.c_str());
        return -1;
    }

    auto registry = std::make_shared<idlrpc::HandlerRegistry>(model, errorReporter);
    if (!registry->registerHandler("A", server::makeInterfaceAHandler())
        || !registry->registerHandler("B", server::makeInterfaceBHandler())) {
        fprintf(stderr, "idlrpcd: handlers do not match IDL file %s.\n", FLAGS_idlFile.c_str());
        return -1;
    }

    auto dispatcher = std::make_shared<idlrpc::Dispatcher>(registry, FLAGS_forceASCII);
    server::JSONTransport transport(stdin, stdout);
    transport.setDispatcher(dispatcher);

    int returnCode = transport.runLoop();

    return returnCode;
}
