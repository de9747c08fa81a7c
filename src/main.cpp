// =============================================================================
// canopy_sync - Sankhya -> Odoo hierarchy synchronization
// =============================================================================
//   canopy_sync <categories|locations> [--config FILE] [--input FILE]
//               [--validate-only] [--verify] [--report-json FILE] [--verbose]
//
// Exit: 0 clean, 1 finished with per-node errors, 2 fatal.
// =============================================================================
#include "config/ConfigLoader.hpp"
#include "config/SyncConfig.hpp"
#include "hierarchy/HierarchyReconciler.hpp"
#include "hierarchy/HierarchyVerifier.hpp"
#include "hierarchy/NodeMapper.hpp"
#include "hierarchy/ReconcileError.hpp"
#include "source/JsonFileReader.hpp"
#include "source/SankhyaGatewayReader.hpp"
#include "store/OdooJsonRpcStore.hpp"

#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace canopy;

namespace {

struct CliArgs {
    std::string profile;
    std::string config_path = "canopy.ini";
    std::string input_path;
    std::string report_json;
    bool validate_only = false;
    bool verify = false;
    bool verbose = false;
};

void usage() {
    std::cerr << "usage: canopy_sync <categories|locations> [--config FILE] [--input FILE]\n"
                 "                   [--validate-only] [--verify] [--report-json FILE] [--verbose]\n";
}

bool parse_args(int argc, char* argv[], CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--config") {
            if (!value(out.config_path)) return false;
        } else if (a == "--input") {
            if (!value(out.input_path)) return false;
        } else if (a == "--report-json") {
            if (!value(out.report_json)) return false;
        } else if (a == "--validate-only") {
            out.validate_only = true;
        } else if (a == "--verify") {
            out.verify = true;
        } else if (a == "--verbose") {
            out.verbose = true;
        } else if (!a.empty() && a[0] != '-' && out.profile.empty()) {
            out.profile = a;
        } else {
            std::cerr << "[SYNC] Unknown argument: " << a << "\n";
            return false;
        }
    }
    return !out.profile.empty();
}

std::unique_ptr<ISourceReader> make_reader(const CliArgs& args, const SyncConfig& cfg) {
    if (!args.input_path.empty()) {
        return std::make_unique<JsonFileReader>(args.input_path);
    }
    std::string sql = SankhyaGatewayReader::load_sql(cfg.profile(args.profile).sql_path);
    return std::make_unique<SankhyaGatewayReader>(cfg.sankhya, sql);
}

int run(const CliArgs& args) {
    auto profile = find_profile(args.profile);
    if (!profile) {
        std::cerr << "[SYNC] Unknown hierarchy: " << args.profile << "\n";
        usage();
        return 2;
    }

    ConfigLoader ini;
    if (!ini.load(args.config_path)) {
        std::cerr << "[CONFIG] Continuing with environment settings only\n";
    }
    SyncConfig cfg = SyncConfig::from(ini);
    if (args.verbose) {
        cfg.verbose = true;
        ini.dump();
    }

    std::cout << "============================================\n";
    std::cout << "  canopy_sync: " << profile->name << " -> " << profile->model << "\n";
    std::cout << "============================================\n";

    // 1. Source batch
    auto rows = make_reader(args, cfg)->read();
    std::vector<Node> nodes = to_nodes(rows, profile->mapping);

    if (args.validate_only) {
        ValidationReport v = HierarchyValidator().validate(nodes);
        std::cout << "[VALIDATE] nodes=" << nodes.size()
                  << " self_ref=" << v.self_references
                  << " orphans=" << v.orphans
                  << " cycles=" << v.cycles
                  << " duplicates=" << v.duplicate_codes
                  << " empty_codes=" << v.empty_codes << "\n";
        return 0;
    }

    // 2. Target
    auto missing = cfg.odoo.missing();
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        throw ConfigError("Odoo settings missing: " + names);
    }
    OdooJsonRpcStore store(cfg.odoo);
    store.connect();

    // 3. Two-pass reconciliation
    ReconcileOptions opts;
    opts.require_key_field = cfg.require_key_field;
    opts.anchor_id = cfg.profile(profile->name).anchor_id;
    opts.verbose = cfg.verbose;

    HierarchyReconciler reconciler(store, *profile, opts);
    RunReport report = reconciler.run(nodes);

    if (!args.report_json.empty()) {
        std::ofstream out(args.report_json);
        if (!out.is_open()) {
            std::cerr << "[SYNC] Cannot write report to " << args.report_json << "\n";
        } else {
            out << report.to_json().dump(2) << "\n";
        }
    }

    // 4. Read back
    bool verified = true;
    if (args.verify && reconciler.capabilities()) {
        HierarchyVerifier verifier(store, reconciler.profile(), *reconciler.capabilities(),
                                   reconciler.anchor_id());
        verified = verifier.verify(nodes).ok();
    }

    return (report.has_errors() || !verified) ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        usage();
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc = 2;
    try {
        rc = run(args);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] FATAL: " << e.what() << "\n";
    } catch (const SourceError& e) {
        std::cerr << "[SYNC] FATAL source: " << e.what() << "\n";
    } catch (const ReconcileError& e) {
        std::cerr << "[SYNC] FATAL: " << e.what() << "\n";
    } catch (const StoreError& e) {
        std::cerr << "[ODOO] FATAL: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[SYNC] FATAL: " << e.what() << "\n";
    }

    curl_global_cleanup();
    return rc;
}
