#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "wirepack/strip.hpp"

using namespace wirepack;

// =============================================================================
// Helpers
// =============================================================================

// A chain of `levels` nested mappings; the outermost sits at depth 0 and
// the innermost at depth levels - 1. The innermost mapping holds an absent
// entry so every level has to be rebuilt.
auto make_chain(std::size_t levels) -> value_t {
    auto node = make_mapping({{"leaf", 1}, {"gone", absent}});
    for (std::size_t i = 1; i < levels; ++i) {
        node = make_mapping({{"child", node}});
    }
    return node;
}

auto chain_length(const value_t& value) -> std::size_t {
    auto n = std::size_t{1};
    const auto* node = &value;
    while (const auto* child = node->as_mapping()->find("child")) {
        node = child;
        ++n;
    }
    return n;
}

auto innermost(const value_t& value) -> const value_t& {
    const auto* node = &value;
    while (const auto* child = node->as_mapping()->find("child")) {
        node = child;
    }
    return *node;
}

auto make_request() -> value_t {
    return make_mapping({
        {"id", 1},
        {"method", "query"},
        {"params", make_mapping({
            {"path", "user.getById"},
            {"input", make_mapping({{"id", 7}, {"filter", absent}})},
            {"context", absent},
        })},
        {"tags", make_sequence({"a", "b"})},
    });
}

// =============================================================================
// Atoms
// =============================================================================

void test_atoms_pass_through() {
    std::cout << "Testing atoms pass through... ";

    assert(strip(value_t(null)).is_null());
    assert(strip(value_t(absent)).is_absent());
    assert(strip(value_t(true)) == value_t(true));
    assert(strip(value_t(-3)) == value_t(-3));
    assert(strip(value_t(2.5)) == value_t(2.5));
    assert(strip(value_t("text")) == value_t("text"));
    assert(strip(value_t(bytes_t{1, 2})) == value_t(bytes_t{1, 2}));

    std::cout << "PASSED\n";
}

// =============================================================================
// Pruning
// =============================================================================

void test_key_omission() {
    std::cout << "Testing absent keys are omitted... ";

    auto input = make_mapping({{"a", 1}, {"b", absent}, {"c", null}});
    auto result = strip(input);
    const auto& m = *result.as_mapping();

    assert(m.size() == 2);
    assert(m.entry(0).first == "a");
    assert(m.entry(1).first == "c");
    assert(m.at("c").is_null());
    assert(!m.contains("b"));

    // The input is left untouched
    assert(input.as_mapping()->size() == 3);
    assert(input.as_mapping()->at("b").is_absent());

    std::cout << "PASSED\n";
}

void test_array_slots_preserved() {
    std::cout << "Testing absent sequence elements are kept... ";

    auto input = make_sequence({1, absent, 3});
    auto result = strip(input);

    assert(same_node(result, input));
    assert(result.as_sequence()->size() == 3);
    assert((*result.as_sequence())[1].is_absent());

    std::cout << "PASSED\n";
}

void test_nested_pruning() {
    std::cout << "Testing nested pruning... ";

    auto input = make_mapping({
        {"outer", make_mapping({{"inner", absent}, {"keep", "yes"}})},
    });
    auto result = strip(input);
    auto expected = make_mapping({{"outer", make_mapping({{"keep", "yes"}})}});

    assert(result == expected);
    assert(!same_node(result, input));

    std::cout << "PASSED\n";
}

void test_sequence_of_mappings() {
    std::cout << "Testing sequences of mappings are pruned element-wise... ";

    auto untouched = make_mapping({{"x", 1}});
    auto input = make_sequence({
        untouched,
        make_mapping({{"x", 2}, {"y", absent}}),
        make_mapping({{"only", absent}}),
    });
    auto result = strip(input);
    const auto& items = *result.as_sequence();

    assert(!same_node(result, input));
    assert(items.size() == 3);
    assert(same_node(items[0], untouched));
    assert(items[1] == make_mapping({{"x", 2}}));
    assert(items[2].is_mapping());
    assert(items[2].as_mapping()->empty());

    std::cout << "PASSED\n";
}

void test_realistic_request() {
    std::cout << "Testing request message pruning... ";

    auto input = make_request();
    auto result = strip(input);
    const auto& params = *result.as_mapping()->at("params").as_mapping();

    assert(params.size() == 2);
    assert(!params.contains("context"));
    assert(params.at("input") == make_mapping({{"id", 7}}));

    // Untouched siblings keep their identity
    assert(same_node(result.as_mapping()->at("tags"), input.as_mapping()->at("tags")));

    std::cout << "PASSED\n";
}

// =============================================================================
// Identity and idempotence
// =============================================================================

void test_identity_preserved() {
    std::cout << "Testing unchanged trees keep their identity... ";

    auto input = make_mapping({
        {"a", make_sequence({1, 2, make_mapping({{"b", null}})})},
        {"c", make_mapping({{"d", "e"}})},
    });
    auto result = strip(input);
    assert(same_node(result, input));

    auto empty_map = make_mapping();
    assert(same_node(strip(empty_map), empty_map));

    auto empty_seq = make_sequence();
    assert(same_node(strip(empty_seq), empty_seq));

    std::cout << "PASSED\n";
}

void test_idempotence() {
    std::cout << "Testing idempotence... ";

    auto once = strip(make_request());
    auto twice = strip(once);

    assert(twice == once);
    assert(same_node(twice, once));

    std::cout << "PASSED\n";
}

void test_copy_starts_at_first_change() {
    std::cout << "Testing unchanged prefix is reused... ";

    auto first = make_mapping({{"k", 1}});
    auto second = make_mapping({{"k", 2}, {"drop", absent}});
    auto third = make_mapping({{"k", 3}});
    auto input = make_sequence({first, second, third});

    auto result = strip(input);
    const auto& items = *result.as_sequence();

    assert(same_node(items[0], first));
    assert(!same_node(items[1], second));
    assert(same_node(items[2], third));

    std::cout << "PASSED\n";
}

// =============================================================================
// Cycles and shared nodes
// =============================================================================

void test_self_cycle() {
    std::cout << "Testing self-referencing mapping... ";

    auto node = make_mapping({{"name", "loop"}, {"gone", absent}});
    node.as_mapping()->set("self", node);

    auto result = strip(node);
    const auto& m = *result.as_mapping();

    assert(!same_node(result, node));
    assert(m.size() == 2);
    assert(m.at("name") == value_t("loop"));
    assert(!m.contains("gone"));

    // The back-reference is the original node, left intact
    assert(same_node(m.at("self"), node));
    assert(m.at("self").as_mapping()->contains("gone"));

    node.as_mapping()->erase("self");
    std::cout << "PASSED\n";
}

void test_mutual_cycle() {
    std::cout << "Testing mutually referencing mappings... ";

    auto a = make_mapping({{"name", "a"}});
    auto b = make_mapping({{"name", "b"}, {"gone", absent}});
    a.as_mapping()->set("peer", b);
    b.as_mapping()->set("peer", a);

    auto result = strip(a);
    const auto& peer = result.as_mapping()->at("peer");

    assert(!peer.as_mapping()->contains("gone"));
    assert(same_node(peer.as_mapping()->at("peer"), a));

    b.as_mapping()->erase("peer");
    std::cout << "PASSED\n";
}

void test_cyclic_sequence() {
    std::cout << "Testing self-containing sequence... ";

    auto seq = make_sequence({1, 2});
    seq.as_sequence()->push_back(seq);

    auto result = strip(seq);
    assert(same_node(result, seq));

    seq.as_sequence()->pop_back();
    std::cout << "PASSED\n";
}

void test_shared_subtree() {
    std::cout << "Testing subtree shared by two parents... ";

    auto shared = make_mapping({{"x", 1}, {"y", absent}});
    auto input = make_mapping({{"p", shared}, {"q", shared}});
    auto result = strip(input);
    const auto& m = *result.as_mapping();

    // Stripped once, and both parents get the same stripped node
    assert(m.at("p") == make_mapping({{"x", 1}}));
    assert(!m.at("q").as_mapping()->contains("y"));
    assert(same_node(m.at("p"), m.at("q")));

    // The input still shares the untouched original
    assert(shared.as_mapping()->contains("y"));

    std::cout << "PASSED\n";
}

void test_shared_subtree_in_sequence() {
    std::cout << "Testing node repeated inside a sequence... ";

    auto shared = make_mapping({{"k", "v"}, {"gone", absent}});
    auto input = make_sequence({shared, 1, shared, make_mapping({{"inner", shared}})});
    auto result = strip(input);
    const auto& items = *result.as_sequence();
    const auto& stripped = items[0];

    assert(stripped == make_mapping({{"k", "v"}}));
    assert(same_node(items[2], stripped));
    assert(same_node(items[3].as_mapping()->at("inner"), stripped));

    std::cout << "PASSED\n";
}

void test_idempotence_with_shared_subtree() {
    std::cout << "Testing idempotence with a shared subtree... ";

    auto shared = make_mapping({{"x", 1}, {"y", absent}});
    auto input = make_mapping({{"p", shared}, {"q", make_sequence({shared})}});

    auto once = strip(input);
    auto twice = strip(once);

    assert(twice == once);
    assert(same_node(twice, once));
    assert(!once.as_mapping()->at("q").as_sequence()->front().as_mapping()->contains("y"));

    std::cout << "PASSED\n";
}

// =============================================================================
// Depth limit
// =============================================================================

void test_chain_of_99() {
    std::cout << "Testing chain of 99 levels... ";

    auto result = strip(make_chain(99));
    assert(chain_length(result) == 99);
    assert(!innermost(result).as_mapping()->contains("gone"));

    std::cout << "PASSED\n";
}

void test_chain_of_150() {
    std::cout << "Testing chain of 150 levels... ";

    auto threw = false;
    try {
        strip(make_chain(150));
    } catch (const depth_exceeded& e) {
        threw = true;
        assert(e.limit() == 100);
        assert(std::string(e.what()) == "maximum depth of 100 exceeded");
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_exact_depth_boundary() {
    std::cout << "Testing exact depth boundary... ";

    // Innermost composite at depth 100
    auto result = strip(make_chain(101));
    assert(chain_length(result) == 101);

    // Innermost composite at depth 101
    auto threw = false;
    try {
        strip(make_chain(102));
    } catch (const depth_exceeded&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_atoms_do_not_count_toward_depth() {
    std::cout << "Testing atoms below the deepest composite... ";

    auto chain = make_chain(101);
    auto result = strip(chain);
    assert(innermost(result).as_mapping()->at("leaf") == value_t(1));

    std::cout << "PASSED\n";
}

void test_custom_max_depth() {
    std::cout << "Testing explicit max depth... ";

    assert(chain_length(strip(make_chain(4), 3)) == 4);

    auto threw = false;
    try {
        strip(make_chain(5), 3);
    } catch (const depth_exceeded& e) {
        threw = true;
        assert(e.limit() == 3);
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_depth_is_per_descent() {
    std::cout << "Testing depth counts descents, not siblings... ";

    auto wide = std::make_shared<mapping_t>();
    for (int i = 0; i < 500; ++i) {
        wide->append("k" + std::to_string(i), make_mapping({{"v", i}, {"x", absent}}));
    }
    auto result = strip(value_t(wide));
    assert(result.as_mapping()->size() == 500);
    assert(result.as_mapping()->at("k499") == make_mapping({{"v", 499}}));

    std::cout << "PASSED\n";
}

// =============================================================================
// Concurrency
// =============================================================================

void test_concurrent_calls() {
    std::cout << "Testing concurrent strip calls over one input... ";

    auto input = make_sequence({make_request(), make_request(), make_chain(50)});
    auto expected = strip(input);
    auto results = std::vector<value_t>(8);
    auto threads = std::vector<std::thread>{};

    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&input, &results, i] {
            results[i] = strip(input);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& r : results) {
        assert(r == expected);
    }

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Pruning ===\n\n";

    test_atoms_pass_through();
    test_key_omission();
    test_array_slots_preserved();
    test_nested_pruning();
    test_sequence_of_mappings();
    test_realistic_request();

    std::cout << "\n=== Identity ===\n\n";

    test_identity_preserved();
    test_idempotence();
    test_copy_starts_at_first_change();

    std::cout << "\n=== Cycles ===\n\n";

    test_self_cycle();
    test_mutual_cycle();
    test_cyclic_sequence();
    test_shared_subtree();
    test_shared_subtree_in_sequence();
    test_idempotence_with_shared_subtree();

    std::cout << "\n=== Depth Limit ===\n\n";

    test_chain_of_99();
    test_chain_of_150();
    test_exact_depth_boundary();
    test_atoms_do_not_count_toward_depth();
    test_custom_max_depth();
    test_depth_is_per_descent();

    std::cout << "\n=== Concurrency ===\n\n";

    test_concurrent_calls();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
