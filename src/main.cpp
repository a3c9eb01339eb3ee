#include "caches.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "http_client.hpp"
#include "query_execution_context.hpp"
#include "query_partition_provider.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

struct Config {
    std::string endpoint   = "http://localhost:8081/";
    std::string collection = "dbs/app/colls/orders";
    std::string query      = "SELECT * FROM c";
    std::string partitionKey;
    std::string continuation;
    std::string enableCrossPartition = "true";
    int         pageSize  = 100;
    int         maxPages  = 10;
    int         timeoutMs = 5000;
    bool        verbose   = false;
};

static void printUsage() {
    std::cout
        << "Usage: partition_query [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL                Gateway endpoint            "
           "(default: http://localhost:8081/)\n"
        << "  --collection LINK             Collection link             "
           "(default: dbs/app/colls/orders)\n"
        << "  --query TEXT                  Query text                  (default: SELECT * FROM c)\n"
        << "  --partition-key VALUE         Restrict to one partition key value\n"
        << "  --continuation TOKEN          Resume from a previous run\n"
        << "  --enable-cross-partition B    true / false                (default: true)\n"
        << "  --page-size N                 Documents per page          (default: 100)\n"
        << "  --max-pages N                 Stop after N pages          (default: 10)\n"
        << "  --timeout-ms N                HTTP timeout in ms          (default: 5000)\n"
        << "  --verbose                     Enable verbose diagnostics\n"
        << "  --help, -h                    Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--endpoint") && i + 1 < argc) {
            cfg.endpoint = argv[++i];
        } else if ((arg == "--collection") && i + 1 < argc) {
            cfg.collection = argv[++i];
        } else if ((arg == "--query") && i + 1 < argc) {
            cfg.query = argv[++i];
        } else if ((arg == "--partition-key") && i + 1 < argc) {
            cfg.partitionKey = argv[++i];
        } else if ((arg == "--continuation") && i + 1 < argc) {
            cfg.continuation = argv[++i];
        } else if ((arg == "--enable-cross-partition") && i + 1 < argc) {
            cfg.enableCrossPartition = argv[++i];
        } else if ((arg == "--page-size") && i + 1 < argc) {
            cfg.pageSize = std::stoi(argv[++i]);
        } else if ((arg == "--max-pages") && i + 1 < argc) {
            cfg.maxPages = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    using namespace partition_query;

    try {
        Config cfg = parseArgs(argc, argv);

        std::cout
            << "=== partition_query ===\n"
            << "Endpoint:    " << cfg.endpoint   << "\n"
            << "Collection:  " << cfg.collection << "\n"
            << "Query:       " << cfg.query      << "\n"
            << "Page size:   " << cfg.pageSize   << "\n"
            << "Max pages:   " << cfg.maxPages   << "\n"
            << "Timeout:     " << cfg.timeoutMs  << " ms\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "=======================\n\n";

        auto http = std::make_shared<HttpClient>(cfg.endpoint, "", cfg.timeoutMs);
        http->setVerbose(cfg.verbose);
        auto metadata = std::make_shared<HttpMetadataSource>(http, cfg.verbose);

        QueryExecutionContext::Collaborators collaborators;
        collaborators.transport              = std::make_shared<HttpTransport>(http, cfg.verbose);
        collaborators.collectionCache        = std::make_shared<MetadataCollectionCache>(metadata, cfg.verbose);
        collaborators.routingMapProvider     = std::make_shared<PartitionKeyRangeCache>(metadata, cfg.verbose);
        collaborators.queryPartitionProvider = std::make_shared<DefaultQueryPartitionProvider>();

        QuerySpec query;
        query.text = cfg.query;
        if (!cfg.partitionKey.empty()) query.partitionKeyValue = cfg.partitionKey;

        FeedOptions options;
        options.maxItemCount              = cfg.pageSize;
        options.enableCrossPartitionQuery = cfg.enableCrossPartition;
        if (!cfg.continuation.empty()) options.requestContinuation = cfg.continuation;

        QueryExecutionContext context(collaborators, ResourceType::Document,
                                      cfg.collection, query, options,
                                      /*isContinuationExpected=*/true,
                                      RetryBudget{}, cfg.verbose);

        std::size_t printed = 0;
        int pages = 0;
        while (pages < cfg.maxPages && context.hasMoreResults()) {
            FeedResponse page = context.executeNext();
            ++pages;
            for (const auto& doc : page.documents) {
                std::cout << std::setw(5) << ++printed << "  " << doc.dump() << "\n";
            }
        }

        const auto stats = context.getStats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Pages:               " << stats.totalPages     << "\n"
            << "Documents:           " << stats.totalDocuments << "\n"
            << "Requests:            " << stats.totalRequests  << "\n"
            << "Retries:             " << stats.totalRetries   << "\n"
            << "Request charge:      " << std::fixed << std::setprecision(2)
                                       << stats.totalRequestCharge << "\n"
            << "Continuation:        "
            << (context.continuation().empty() ? "<done>" : context.continuation()) << "\n"
            << "======================\n";

        return 0;

    } catch (const QueryError& e) {
        std::cerr << "Query failed (" << toString(e.kind()) << "): " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
