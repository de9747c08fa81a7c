#include "hierarchy/RunReport.hpp"
#include <iomanip>
#include <sstream>

using namespace canopy;

static void row(std::ostringstream& out, const char* label, size_t value) {
    out << "  " << std::left << std::setw(28) << label << std::right << std::setw(8) << value << "\n";
}

std::string RunReport::summary(const std::string& title) const {
    std::ostringstream out;
    out << "============================================\n";
    out << "  " << title << "\n";
    out << "============================================\n";
    row(out, "Created", created);
    row(out, "Updated", updated);
    row(out, "Errors", errors);
    row(out, "Parents applied", parents_applied);
    row(out, "Orphans in run", orphans_in_run);
    row(out, "Errors in pass B", parent_errors);
    row(out, "Roots", roots);
    row(out, "Self-references skipped", self_references_skipped);
    row(out, "Cycle edges skipped", cycle_edges_skipped);
    row(out, "Skipped (failed in pass A)", unmaterialized_skipped);
    row(out, "Parent links settled", links_settled());
    out << "--------------------------------------------\n";
    row(out, "Source self-references", validation.self_references);
    row(out, "Source orphans", validation.orphans);
    row(out, "Source cycles", validation.cycles);
    row(out, "Source duplicate codes", validation.duplicate_codes);
    row(out, "Source empty codes", validation.empty_codes);
    out << "============================================\n";
    return out.str();
}

nlohmann::json RunReport::to_json() const {
    return {
        {"created", created},
        {"updated", updated},
        {"errors", errors},
        {"parents_applied", parents_applied},
        {"orphans_in_run", orphans_in_run},
        {"parent_errors", parent_errors},
        {"roots", roots},
        {"self_references_skipped", self_references_skipped},
        {"cycle_edges_skipped", cycle_edges_skipped},
        {"unmaterialized_skipped", unmaterialized_skipped},
        {"links_settled", links_settled()},
        {"validation", {
            {"self_references", validation.self_references},
            {"orphans", validation.orphans},
            {"cycles", validation.cycles},
            {"duplicate_codes", validation.duplicate_codes},
            {"empty_codes", validation.empty_codes}
        }}
    };
}
