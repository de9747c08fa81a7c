#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <random>

#include "hierarchy/HierarchyReconciler.hpp"
#include "hierarchy/ReconcileError.hpp"
#include "OdooFixture.hpp"

namespace canopy {
namespace test {

class HierarchyReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = seed_categories(store_, true);
    }

    RunReport run(const std::vector<Node>& nodes, ReconcileOptions opts = {}) {
        HierarchyReconciler reconciler(store_, category_profile(), opts);
        return reconciler.run(nodes);
    }

    RecordId id_of(const std::string& code) {
        auto rows = store_.search("product.category",
                                  json::array({json::array({"x_sankhya_id", "=", code})}),
                                  {"id"}, 0);
        EXPECT_EQ(rows.size(), 1u) << "records for code " << code;
        return rows.empty() ? 0 : rows[0]["id"].get<RecordId>();
    }

    RecordId parent_of(const std::string& code) {
        json p = store_.get("product.category", id_of(code)).value("parent_id", json());
        return p.is_number_integer() ? p.get<RecordId>() : 0;
    }

    // code -> parent code (or "<anchor>") for every synced record
    std::map<std::string, std::string> links() {
        std::map<RecordId, std::string> code_by_id;
        for (RecordId id : store_.ids("product.category")) {
            json code = store_.get("product.category", id).value("x_sankhya_id", json());
            if (code.is_string()) code_by_id[id] = code.get<std::string>();
        }
        std::map<std::string, std::string> out;
        for (const auto& kv : code_by_id) {
            json p = store_.get("product.category", kv.first).value("parent_id", json());
            RecordId pid = p.is_number_integer() ? p.get<RecordId>() : 0;
            out[kv.second] = (pid == root_) ? "<anchor>" : code_by_id[pid];
        }
        return out;
    }

    MemoryStore store_;
    RecordId root_{0};
};

TEST_F(HierarchyReconcilerTest, ChainIsMaterialized) {
    RunReport r = run({node("A", "0"), node("B", "A"), node("C", "B")});

    EXPECT_EQ(r.created, 3u);
    EXPECT_EQ(r.updated, 0u);
    EXPECT_EQ(r.errors, 0u);
    EXPECT_EQ(r.parents_applied, 2u);
    EXPECT_EQ(r.roots, 1u);
    EXPECT_EQ(r.links_settled(), 3u);
    EXPECT_EQ(r.orphans_in_run, 0u);
    EXPECT_FALSE(r.has_errors());

    EXPECT_EQ(parent_of("A"), root_);
    EXPECT_EQ(parent_of("B"), id_of("A"));
    EXPECT_EQ(parent_of("C"), id_of("B"));
}

TEST_F(HierarchyReconcilerTest, WritesLabelAndStagingFields) {
    Node a = node("10", "0", "Food", 1);
    Node b = node("11", "10", "", 2);
    b.display_name.clear();
    run({a, b});

    const Record& rb = store_.get("product.category", id_of("11"));
    EXPECT_EQ(rb["name"], "[11] Grupo 11");
    EXPECT_EQ(rb["x_parent_sankhya_id"], "10");
    EXPECT_EQ(rb["x_grau"], 2);
    EXPECT_EQ(store_.get("product.category", id_of("10"))["name"], "[10] Food");
}

TEST_F(HierarchyReconcilerTest, TwoCycleLeavesOneEdgeUnwritten) {
    RunReport r = run({node("A", "B"), node("B", "A")});

    EXPECT_EQ(r.validation.cycles, 1u);
    EXPECT_EQ(r.created, 2u);
    EXPECT_EQ(r.parents_applied, 1u);
    EXPECT_EQ(r.cycle_edges_skipped, 1u);
    EXPECT_EQ(r.parent_errors, 0u);
    // creates in pass A, a single parent write in pass B
    EXPECT_EQ(store_.counters().update, 1);

    EXPECT_EQ(parent_of("A"), id_of("B"));
    EXPECT_EQ(parent_of("B"), root_);
}

TEST_F(HierarchyReconcilerTest, ThreeCycleNeverMaterializes) {
    RunReport r = run({node("X", "Y"), node("Y", "Z"), node("Z", "X")});

    EXPECT_EQ(r.validation.cycles, 1u);
    EXPECT_EQ(r.parents_applied, 2u);
    EXPECT_EQ(r.cycle_edges_skipped, 1u);

    // walking up from any member reaches the anchor
    for (const std::string code : {"X", "Y", "Z"}) {
        RecordId cur = id_of(code);
        for (int hops = 0; cur != root_; ++hops) {
            ASSERT_LT(hops, 4) << "loop above " << code;
            json p = store_.get("product.category", cur).value("parent_id", json());
            ASSERT_TRUE(p.is_number_integer());
            cur = p.get<RecordId>();
        }
    }
}

TEST_F(HierarchyReconcilerTest, OrphanStaysAnchored) {
    RunReport r = run({node("A", "Z")});

    EXPECT_EQ(r.validation.orphans, 1u);
    EXPECT_EQ(r.created, 1u);
    EXPECT_EQ(r.orphans_in_run, 1u);
    EXPECT_EQ(r.parents_applied, 0u);
    EXPECT_FALSE(r.has_errors());
    EXPECT_EQ(parent_of("A"), root_);
}

TEST_F(HierarchyReconcilerTest, SelfReferenceStaysAnchored) {
    RunReport r = run({node("A", "A"), node("B", "A")});

    EXPECT_EQ(r.validation.self_references, 1u);
    EXPECT_EQ(r.self_references_skipped, 1u);
    EXPECT_EQ(r.parents_applied, 1u);
    EXPECT_EQ(parent_of("A"), root_);
    EXPECT_EQ(parent_of("B"), id_of("A"));
}

TEST_F(HierarchyReconcilerTest, SecondRunIsIdempotent) {
    std::vector<Node> batch = {node("A", "0"), node("B", "A"), node("C", "B"),
                               node("D", "E"), node("E", "D"), node("F", "Q")};
    RunReport first = run(batch);
    auto links_after_first = links();
    size_t count_after_first = store_.count("product.category");

    RunReport second = run(batch);
    EXPECT_EQ(second.created, 0u);
    EXPECT_EQ(second.updated, batch.size());
    EXPECT_EQ(second.parents_applied, first.parents_applied);
    EXPECT_EQ(second.cycle_edges_skipped, first.cycle_edges_skipped);
    EXPECT_EQ(store_.count("product.category"), count_after_first);
    EXPECT_EQ(links(), links_after_first);
}

TEST_F(HierarchyReconcilerTest, ShuffledBatchResolvesSameLinks) {
    std::vector<Node> batch = {node("1", "0", "", 1), node("2", "1", "", 2), node("3", "1", "", 2),
                               node("4", "2", "", 3), node("5", "4"), node("6", "7"), node("7", "6")};
    run(batch);
    auto expected = links();

    std::mt19937 rng(7);
    for (int round = 0; round < 3; ++round) {
        MemoryStore other;
        RecordId other_root = seed_categories(other, true);
        std::shuffle(batch.begin(), batch.end(), rng);
        HierarchyReconciler(other, category_profile()).run(batch);

        std::swap(store_, other);
        std::swap(root_, other_root);
        EXPECT_EQ(links(), expected) << "round " << round;
    }
}

TEST_F(HierarchyReconcilerTest, ParentFromEarlierRunResolvedByLookup) {
    run({node("P", "0")});
    RunReport r = run({node("Q", "P")});

    EXPECT_EQ(r.orphans_in_run, 0u);
    EXPECT_EQ(r.parents_applied, 1u);
    EXPECT_EQ(parent_of("Q"), id_of("P"));
}

TEST_F(HierarchyReconcilerTest, CycleThroughEarlierRunIsRefused) {
    // P already sits under Q in the target; the new batch asks for Q under P
    run({node("Q", "0"), node("P", "Q")});
    RunReport r = run({node("Q", "P")});

    EXPECT_EQ(r.cycle_edges_skipped, 1u);
    EXPECT_EQ(r.parent_errors, 0u);
    EXPECT_EQ(parent_of("P"), id_of("Q"));
    EXPECT_EQ(parent_of("Q"), root_);
}

TEST_F(HierarchyReconcilerTest, CycleThroughStoredAncestorsIsRefused) {
    // target holds Q <- P <- S; the new batch asks for Q under S
    run({node("Q", "0"), node("P", "Q"), node("S", "P")});
    RunReport r = run({node("Q", "S")});

    EXPECT_EQ(r.cycle_edges_skipped, 1u);
    EXPECT_EQ(r.parent_errors, 0u);
    EXPECT_FALSE(r.has_errors());
    EXPECT_EQ(parent_of("Q"), root_);
    EXPECT_EQ(parent_of("P"), id_of("Q"));
    EXPECT_EQ(parent_of("S"), id_of("P"));
}

TEST_F(HierarchyReconcilerTest, FailedCreateIsCountedAndSkipped) {
    store_.set_write_hook([](const std::string& op, const std::string&, const json& values) {
        if (op == "create" && values.value("x_sankhya_id", std::string()) == "B") {
            throw StoreError("connection reset");
        }
    });
    RunReport r = run({node("A", "0"), node("B", "A"), node("C", "B")});

    EXPECT_EQ(r.created, 2u);
    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.unmaterialized_skipped, 1u);
    EXPECT_EQ(r.orphans_in_run, 1u);   // C: parent B never materialized
    EXPECT_TRUE(r.has_errors());
    EXPECT_EQ(parent_of("C"), root_);
}

TEST_F(HierarchyReconcilerTest, FailedRootCreateIsNotSettled) {
    store_.set_write_hook([](const std::string& op, const std::string&, const json& values) {
        if (op == "create" && values.value("x_sankhya_id", std::string()) == "A") {
            throw StoreError("connection reset");
        }
    });
    RunReport r = run({node("A", "0"), node("E", "")});
    store_.set_write_hook(nullptr);

    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.created, 1u);
    EXPECT_EQ(r.roots, 1u);                  // E only
    EXPECT_EQ(r.unmaterialized_skipped, 1u);
    EXPECT_EQ(r.links_settled(), 1u);
    EXPECT_EQ(store_.count("product.category"), 2u);
}

TEST_F(HierarchyReconcilerTest, EmptyCodeRootIsNotSettled) {
    RunReport r = run({node("", "")});

    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.roots, 0u);
    EXPECT_EQ(r.unmaterialized_skipped, 1u);
    EXPECT_EQ(r.links_settled(), 0u);
}

TEST_F(HierarchyReconcilerTest, FailedParentWriteIsCountedAndRunContinues) {
    store_.set_write_hook([](const std::string& op, const std::string&, const json&) {
        if (op == "update") throw StoreError("timeout");
    });
    RunReport r = run({node("A", "0"), node("B", "A"), node("C", "B")});

    EXPECT_EQ(r.created, 3u);
    EXPECT_EQ(r.parent_errors, 2u);
    EXPECT_EQ(r.parents_applied, 0u);
    EXPECT_TRUE(r.has_errors());
    EXPECT_EQ(parent_of("B"), root_);
    EXPECT_EQ(parent_of("C"), root_);
}

TEST_F(HierarchyReconcilerTest, EmptyCodeRejectedPerNode) {
    RunReport r = run({node("", "A"), node("A", "0")});

    EXPECT_EQ(r.validation.empty_codes, 1u);
    EXPECT_EQ(r.errors, 1u);
    EXPECT_EQ(r.created, 1u);
    EXPECT_EQ(r.unmaterialized_skipped, 1u);
}

TEST_F(HierarchyReconcilerTest, MissingAnchorIsFatal) {
    MemoryStore bare;
    bare.define_model("product.category", category_fields(true), "parent_id");
    HierarchyReconciler reconciler(bare, category_profile());
    EXPECT_THROW(reconciler.run({node("A", "0")}), ReconcileError);
    EXPECT_EQ(bare.count("product.category"), 0u);
}

TEST_F(HierarchyReconcilerTest, AnchorOverride) {
    RecordId staging = store_.seed("product.category", {{"name", "Sankhya"}, {"parent_id", root_}});
    ReconcileOptions opts;
    opts.anchor_id = staging;
    run({node("A", "0"), node("B", "Z")}, opts);

    EXPECT_EQ(parent_of("A"), staging);
    EXPECT_EQ(parent_of("B"), staging);
}

TEST_F(HierarchyReconcilerTest, MissingAnchorOverrideIsFatal) {
    ReconcileOptions opts;
    opts.anchor_id = 9999;
    HierarchyReconciler reconciler(store_, category_profile(), opts);
    store_.reset_counters();

    EXPECT_THROW(reconciler.run({node("A", "0"), node("B", "A")}), ReconcileError);
    EXPECT_EQ(store_.counters().create, 0);
    EXPECT_EQ(store_.count("product.category"), 1u);
}

TEST_F(HierarchyReconcilerTest, RequireKeyFieldRefusesLabelMatching) {
    MemoryStore plain;
    seed_categories(plain, false);
    ReconcileOptions opts;
    opts.require_key_field = true;
    HierarchyReconciler reconciler(plain, category_profile(), opts);
    EXPECT_THROW(reconciler.run({node("A", "0")}), ReconcileError);
}

TEST_F(HierarchyReconcilerTest, LabelPrefixKeepsRunsIdempotent) {
    MemoryStore plain;
    RecordId all = seed_categories(plain, false);
    HierarchyReconciler reconciler(plain, category_profile());

    reconciler.run({node("1", "0", "Food"), node("10", "1", "Fruit")});
    ASSERT_TRUE(reconciler.capabilities().has_value());
    EXPECT_EQ(reconciler.capabilities()->key_strategy(), KeyStrategy::LabelPrefix);
    EXPECT_EQ(reconciler.anchor_id(), all);

    // renamed in the source: found again by its "[code]" prefix
    RunReport r = reconciler.run({node("1", "0", "Groceries"), node("10", "1", "Fruit")});
    EXPECT_EQ(r.created, 0u);
    EXPECT_EQ(r.updated, 2u);
    EXPECT_EQ(plain.count("product.category"), 3u);

    auto rows = plain.search("product.category",
                             json::array({json::array({"name", "=like", "[10]%"})}),
                             {"name", "parent_id"}, 0);
    ASSERT_EQ(rows.size(), 1u);
    auto food = plain.search("product.category",
                             json::array({json::array({"name", "=", "[1] Groceries"})}), {"id"}, 0);
    ASSERT_EQ(food.size(), 1u);
    EXPECT_EQ(many2one_id(rows[0]["parent_id"]).value_or(0), food[0]["id"].get<RecordId>());
}

TEST_F(HierarchyReconcilerTest, LocationsKeyedByBarcodeUnderWarehouseStock) {
    MemoryStore stock;
    RecordId lot_stock = seed_locations(stock);
    HierarchyReconciler reconciler(stock, location_profile());

    reconciler.run({node("100", "0", "Main"), node("101", "100", "Rack 1")});
    EXPECT_EQ(reconciler.anchor_id(), lot_stock);

    auto find = [&stock](const std::string& code) {
        auto rows = stock.search("stock.location",
                                 json::array({json::array({"barcode", "=", code})}), {}, 0);
        EXPECT_EQ(rows.size(), 1u);
        return rows.empty() ? json() : rows[0];
    };
    json main_loc = find("100");
    json rack = find("101");
    EXPECT_EQ(main_loc["name"], "Main");
    EXPECT_EQ(main_loc["usage"], "internal");
    EXPECT_EQ(main_loc["active"], true);
    EXPECT_EQ(many2one_id(main_loc["location_id"]).value_or(0), lot_stock);
    EXPECT_EQ(many2one_id(rack["location_id"]).value_or(0), main_loc["id"].get<RecordId>());

    RunReport again = reconciler.run({node("100", "0", "Main"), node("101", "100", "Rack 1")});
    EXPECT_EQ(again.created, 0u);
    EXPECT_EQ(again.updated, 2u);
    EXPECT_EQ(stock.count("stock.location"), 4u);
}

TEST_F(HierarchyReconcilerTest, RunRowsMapsSourceColumns) {
    HierarchyReconciler reconciler(store_, category_profile());
    RunReport r = reconciler.run_rows({
        {{"CODGRUPOPROD", 1}, {"CODGRUPAI", 0}, {"DESCRGRUPOPROD", "Food"}, {"GRAU", 1}},
        {{"CODGRUPOPROD", 2}, {"CODGRUPAI", 1}, {"DESCRGRUPOPROD", "Fruit"}, {"GRAU", 2}}
    });
    EXPECT_EQ(r.created, 2u);
    EXPECT_EQ(r.parents_applied, 1u);
    EXPECT_EQ(parent_of("2"), id_of("1"));
}

TEST_F(HierarchyReconcilerTest, ReportSerializes) {
    RunReport r = run({node("A", "0"), node("B", "A")});
    json j = r.to_json();
    EXPECT_EQ(j["created"], 2);
    EXPECT_EQ(j["parents_applied"], 1);
    EXPECT_EQ(j["links_settled"], 2);
    EXPECT_EQ(j["validation"]["cycles"], 0);
    EXPECT_NE(r.summary("Summary").find("Parents applied"), std::string::npos);
}

} // namespace test
} // namespace canopy
