#include "core/http_client.h"
#include "core/scan_config.h"
#include "core/scanner.h"
#include "logging/chain.h"
#include "logging/events.h"
#include "report/local_json_sink.h"
#include "report/remote_document_sink.h"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {

const std::string kRule(80, '=');

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

// Helper function
std::string title_case(const std::string& type) {
    std::string out;
    bool start = true;
    for (char c : type) {
        if (c == '_') {
            out += ' ';
            start = true;
        } else {
            out += start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            start = false;
        }
    }
    return out;
}

/**
 * @brief Prints the scan summary block
 * @param stats Settled statistics of the finished scan
 */
void print_summary(const ScanStats& stats) {
    std::cout << "\n" << kRule << "\nSCAN SUMMARY\n" << kRule << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scan Duration: " << stats.duration << " seconds\n";
    std::cout << "Total URLs Scanned: " << stats.scanned_urls.size() << "\n";
    std::cout << "Total Links Scanned: " << stats.scanned_links.size() << "\n";
    std::cout << "Total Forms Scanned: " << stats.scanned_forms.size() << "\n";
    std::cout << "Total Vulnerabilities Found: " << stats.findings.size() << "\n";

    std::cout << "\nVulnerabilities by Type:\n";
    for (const auto& [type, count] : stats.vulnerabilities_by_type) {
        std::cout << "  " << title_case(type) << ": " << count << "\n";
    }

    std::cout << "\nPerformance Metrics:\n";
    std::cout << "  Average Response Time: " << stats.avg_response_time() << " seconds\n";
    std::cout << "  Minimum Response Time: " << stats.min_response_time << " seconds\n";
    std::cout << "  Maximum Response Time: " << stats.max_response_time << " seconds\n";
    std::cout << kRule << "\n";
}

void print_finding(const Finding& f) {
    const auto& d = f.details;
    std::cout << "\nVULNERABILITY FOUND\n" << kRule << "\n";
    std::cout << "Type: " << f.type << "\n";
    std::cout << "File: " << f.file << "\n";
    std::cout << "URL: " << f.url << "\n";
    std::cout << "Timestamp: " << f.timestamp << "\n";
    std::cout << "Severity: " << d.value("severity", "") << "\n";
    std::cout << "Description: " << d.value("description", "") << "\n";
    if (d.contains("header_description")) {
        std::cout << "Purpose: " << d.value("header_description", "") << "\n";
    }
    if (d.contains("consequences")) {
        std::cout << "\nWhat could happen if not fixed: " << d.value("consequences", "") << "\n";
    }
    if (d.contains("input_field")) {
        std::cout << "\nForm Details:\n";
        std::cout << "  Action: " << d.value("form_action", "") << "\n";
        std::cout << "  Method: " << d.value("method", "") << "\n";
        std::cout << "  Input Field: " << d.value("input_field", "") << "\n";
    }
    if (d.contains("payload") && d["payload"].is_string()) {
        std::cout << "\nPayload: " << d["payload"].get<std::string>() << "\n";
    }
    std::cout << "\nRecommendation: " << d.value("recommendation", "") << "\n";
    std::cout << kRule << "\n";
}

/**
 * @brief Prints findings, links, forms and error counts after the summary
 */
void print_details(const ScanStats& stats, const std::string& output_dir) {
    if (stats.findings.empty()) {
        std::cout << "\nNo vulnerabilities found.\n";
    } else {
        std::cout << "\nDETAILED VULNERABILITIES\n";
        for (const auto& f : stats.findings) print_finding(f);
    }

    if (stats.scanned_links.empty()) {
        std::cout << "\nNo links were scanned.\n";
    } else {
        std::cout << "\n" << kRule << "\nSCANNED LINKS\n" << kRule << "\n";
        for (const auto& link : stats.scanned_links) {
            std::cout << "\nSource URL: " << link.source_url << "\n";
            std::cout << "Target URL: " << link.target_url << "\n";
            std::cout << "Timestamp: " << link.timestamp << "\n";
            std::cout << std::string(40, '-') << "\n";
        }
        std::cout << kRule << "\n";
    }

    if (stats.scanned_forms.empty()) {
        std::cout << "\nNo forms were scanned.\n";
    } else {
        std::cout << "\n" << kRule << "\nSCANNED FORMS\n" << kRule << "\n";
        for (const auto& record : stats.scanned_forms) {
            std::cout << "\nURL: " << record.url << "\n";
            std::cout << "Action: " << record.form.action << "\n";
            std::cout << "Method: " << record.form.method << "\n";
            std::cout << "Inputs:\n";
            for (const auto& input : record.form.inputs) {
                std::cout << "  - " << input.name << " (" << input.type << ")\n";
            }
            std::cout << "Timestamp: " << record.timestamp << "\n";
            std::cout << std::string(40, '-') << "\n";
        }
        std::cout << kRule << "\n";
    }

    if (!stats.errors_by_type.empty()) {
        std::cout << "\nERRORS ENCOUNTERED\n";
        for (const auto& [type, count] : stats.errors_by_type) {
            std::cout << type << ": " << count << "\n";
        }
    }

    std::cout << "\nDetailed results saved to " << output_dir << "/detailed_results.json\n";
}

/**
 * @brief Runs a scan of one target and persists the results
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 when the scan completed, 1 when it failed, 2 on a usage error
 */
int cmd_scan(int argc, char** argv) {
    std::string target;
    std::string scan_id;
    std::string config_path;
    std::string out_dir;
    bool verbose = false;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--url" && i + 1 < argc) {
            target = argv[++i];
        } else if (a == "--scan-id" && i + 1 < argc) {
            scan_id = argv[++i];
        } else if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (a == "--verbose" || a == "-v") {
            verbose = true;
        } else {
            std::cerr << "Error: unknown argument " << a << "\n";
            return 2;
        }
    }

    bool interactive = scan_id.empty();
    if (target.empty()) target = env_or_empty("TARGET_URL");
    if (scan_id.empty()) scan_id = env_or_empty("SCAN_ID");

    if (target.empty()) {
        std::cerr << "Error: --url required (or set TARGET_URL)\n";
        return 2;
    }
    if (target.find("://") == std::string::npos) {
        target = "http://" + target;
    }

    ScanConfig config = ScanConfig::load(config_path);
    if (!out_dir.empty()) config.output_dir = out_dir;
    if (scan_id.empty()) scan_id = Scanner::generate_scan_id();

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        std::cerr << "Warning: Could not create output directory " << config.output_dir
                  << ": " << ec.message() << "\n";
    }

    logging::ConsoleObserver console(verbose, config.log_file);
    logging::AuditChain chain(config.audit_log_path(), scan_id);
    if (!chain.is_open()) {
        std::cerr << "Warning: Audit log " << config.audit_log_path() << " could not be opened\n";
    }
    logging::ChainObserver chain_observer(chain);
    logging::EventBus events;
    events.attach(&console);
    events.attach(&chain_observer);

    std::cout << "\nStarting scan for: " << target << "\n";

    try {
        HttpClient client(config.client_options());

        std::unique_ptr<ResultSink> sink;
        if (!config.results_store_url.empty()) {
            sink = std::make_unique<RemoteDocumentSink>(client, config.results_store_url,
                                                        config.results_store_token);
        } else {
            sink = std::make_unique<LocalJsonSink>(config.output_dir, config.to_json());
        }

        Scanner scanner(config, client, *sink, events);
        scanner.start_scan(target, scan_id);

        if (interactive) {
            ScanStats stats = scanner.stats();
            print_summary(stats);
            print_details(stats, config.output_dir);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Scan failed: " << e.what() << "\n";
        std::cout << "Scan ID: " << scan_id << "\n";
        return 1;
    }

    std::cout << "Scan ID: " << scan_id << "\n";
    return 0;
}

/**
 * @brief Verifies the integrity of a hash-chained audit log
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: warden verify <audit-log.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    auto result = logging::AuditChain::verify(log_path);
    if (result.valid) {
        std::cout << "Chain intact: " << result.entries << " records\n";
        return 0;
    }
    std::cerr << "Verification failed at record " << result.failed_index << ": " << result.error << "\n";
    return 1;
}

void usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  warden scan --url URL [--scan-id ID] [--config FILE] [--out DIR] [--verbose]\n";
    std::cerr << "  warden verify <audit-log.jsonl>\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }

    std::string command = argv[1];

    if (command == "scan") {
        return cmd_scan(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n";
    usage();
    return 2;
}
