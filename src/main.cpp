//
//  main.cpp
//  Threadmail
//

#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <pthread.h>
#include <signal.h>
#include <sqlite3.h>

#include <SQLiteCpp/SQLiteCpp.h>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "threadmail/attachment_store.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/delivery_hub.hpp"
#include "threadmail/http_frontend.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/line_server.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/message_store.hpp"
#include "threadmail/relay_client.hpp"
#include "threadmail/server_config.hpp"
#include "threadmail/spd_log_extensions.hpp"
#include "threadmail/thread_utils.hpp"

using namespace nlohmann;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path SERVER_HOST=mail.example.com threadmail [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, MODE, CONFIG, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: serve or migrate." },
    {CONFIG,  0,"c", "config",  CArg::Optional,  "  --config, -c  \tOptional: JSON settings file. Environment variables take precedence." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: log to the console instead of the log file." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log every protocol command and request." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        fn();
    } catch (GenericException & ex) {
        resp["error"] = ex.toJSON();
        code = 1;
    } catch (SQLite::Exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    std::cout << "\n" << resp.dump();
    return code;
}

void setupLogging(ServerConfig & config, bool orphan, bool verbose) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    std::string pattern;

    if (!orphan) {
        // Running as a service: log everything to a rotating log file with
        // the full logger format.
        pattern = "%P %N %+";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.logPath(), 1048576 * 5, 3));
        sinks.push_back(std::make_shared<SPDFlusherSink>());
    } else {
        // Attached to a console: log to stdout in an abbreviated format.
        pattern = "%l [%N]: %v";
        sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }

    // Always log critical errors to stderr as well as the log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>(THREADMAIL_LOGGER_NAME, std::begin(sinks), std::end(sinks));
    logger->set_formatter(SPDFormatterWithThreadNames(pattern));
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::register_logger(logger);
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    ServerConfig config;
    try {
        if (options[CONFIG].count() > 0 && options[CONFIG].arg) {
            config.mergeFile(options[CONFIG].arg);
        }
    } catch (MailException & ex) {
        std::cout << "\n" << ex.toJSON().dump();
        return 1;
    }
    config.mergeEnvironment();

    auto problems = config.valid();
    if (problems.size() > 0) {
        json resp = {{"error", "Configuration is missing or has invalid fields"}, {"fields", problems}};
        std::cout << "\n" << resp.dump();
        return 1;
    }

    if (!MailUtils::ensureDirectory(config.configDirPath())) {
        json resp = {{"error", "Could not create " + config.configDirPath()}};
        std::cout << "\n" << resp.dump();
        return 1;
    }

    // keep SQLite's temporary files beside the database
    sqlite3_temp_directory = sqlite3_mprintf("%s", config.configDirPath().c_str());

    std::string mode(options[MODE].arg);

    if (mode == "migrate") {
        return runSingleFunctionAndExit([&](){
            MessageStore store(config.databasePath());
            store.migrate();
        });
    }

    if (mode != "serve") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    setupLogging(config, options[ORPHAN] != nullptr, options[VERBOSE] != nullptr);
    auto logger = spdlog::get("logger");

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    // Block termination signals before any thread starts so that they are
    // delivered to the sigwait below rather than to a worker.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    logger->info("------------- Starting Threadmail ({}) ---------------", config.serverHost());
    logger->info("Configuration: {}", config.toJSON().dump());

    try {
        MessageStore store(config.databasePath());
        store.migrate();
    } catch (SQLite::Exception & ex) {
        logger->critical("Could not migrate {}: {}", config.databasePath(), ex.what());
        return 1;
    }

    std::unique_ptr<AccountDirectory> accounts;
    try {
        accounts.reset(new AccountDirectory(config.accountsPath(), config.serverHost(), config.isDevelopment()));
    } catch (MailException & ex) {
        logger->critical("Could not load accounts: {}", ex.toJSON().dump());
        return 1;
    }

    DeliveryHub hub(config.databasePath(), config.dispatchThreads(), std::chrono::seconds(config.keepaliveInterval()));
    LocalAttachmentStore attachments(config.attachmentsPath());
    RelayClient relay(config.serverHost(), config.relayPort(), config.relayTimeout());
    IngestionAdapter ingestion(accounts.get(), &hub, &relay, &attachments);

    LineServer lineServer(config.databasePath(), accounts.get(), &ingestion);
    HttpFrontend httpFrontend(config.databasePath(), accounts.get(), &ingestion, &hub);

    try {
        lineServer.start(config.tcpPort());
        httpFrontend.start(config.httpPort());
    } catch (MailException & ex) {
        logger->critical("Could not start listeners: {}", ex.toJSON().dump());
        lineServer.stop();
        httpFrontend.stop();
        hub.shutdown();
        return 1;
    }

    int sig = 0;
    sigwait(&signals, &sig);
    logger->info("Received signal {}, shutting down", sig);

    lineServer.stop();
    httpFrontend.stop();
    hub.shutdown();
    curl_global_cleanup();

    logger->info("------------- Threadmail stopped ---------------");
    logger->flush();
    return 0;
}
