#include <catch2/catch_test_macros.hpp>
#include "core/content_block.hpp"

#include <algorithm>

using namespace nutty;
using namespace nutty::blocks;

namespace {

const Timestamp kCreated(1747635175906);
const Timestamp kLater(1747635200000);

NuttyId make_id(int64_t offset_ms) {
    return NuttyId::now(kCreated + std::chrono::milliseconds{offset_ms}, TimeZone::utc());
}

FractionalIndex idx(std::string_view value) {
    return FractionalIndex::from_string(value).unwrap();
}

ContentBlock make_block(const NuttyId& id, std::optional<NuttyId> parent,
                        std::string_view f_index, BlockContent content) {
    return create(id, std::move(parent), idx(f_index), std::move(content), kCreated);
}

std::vector<std::string> texts(const std::vector<ContentBlock>& blocks) {
    std::vector<std::string> out;
    for (const auto& block : blocks) {
        out.push_back(get_text(block.content));
    }
    return out;
}

// page
//   first   ("8")
//   second  ("O")
//     nested ("O")
//   third   ("f")
// other page
struct Tree {
    NuttyId page_id = make_id(0);
    NuttyId first_id = make_id(1);
    NuttyId second_id = make_id(2);
    NuttyId third_id = make_id(3);
    NuttyId nested_id = make_id(4);
    NuttyId other_id = make_id(5);

    std::vector<ContentBlock> blocks{
        make_block(third_id, page_id, "f", Paragraph{"third"}),
        make_block(page_id, std::nullopt, "OP", Page{"page"}),
        make_block(nested_id, second_id, "O", Paragraph{"nested"}),
        make_block(first_id, page_id, "8", Heading{"first"}),
        make_block(other_id, std::nullopt, "fgP", Page{"other page"}),
        make_block(second_id, page_id, "O", Paragraph{"second"}),
    };

    const ContentBlock& get(const NuttyId& id) const {
        return *std::find_if(blocks.begin(), blocks.end(),
                             [&](const ContentBlock& b) { return b.id == id; });
    }

    void replace(const ContentBlock& block) {
        std::replace_if(blocks.begin(), blocks.end(),
                        [&](const ContentBlock& b) { return b.id == block.id; }, block);
    }
};

} // namespace

TEST_CASE("Block content kinds", "[blocks]") {
    SECTION("Page") {
        BlockContent content = Page{"Parent Page"};
        REQUIRE(get_kind(content) == BlockKind::Page);
        REQUIRE(get_text(content) == "Parent Page");
    }

    SECTION("Heading") {
        BlockContent content = Heading{"# Title"};
        REQUIRE(get_kind(content) == BlockKind::Heading);
        REQUIRE(get_text(content) == "# Title");
    }

    SECTION("Paragraph") {
        BlockContent content = Paragraph{"Some *text*"};
        REQUIRE(get_kind(content) == BlockKind::Paragraph);
        REQUIRE(get_text(content) == "Some *text*");
    }

    SECTION("Kind names round-trip") {
        for (auto kind : {BlockKind::Page, BlockKind::Heading, BlockKind::Paragraph}) {
            REQUIRE(parse_kind(kind_name(kind)) == kind);
        }
        REQUIRE_FALSE(parse_kind("Todo").has_value());
        REQUIRE_FALSE(parse_kind("page").has_value());
    }
}

TEST_CASE("Block creation", "[blocks]") {
    auto id = make_id(0);
    auto parent = make_id(1);

    auto block = create(id, parent, idx("OP"), Paragraph{"Hello, world!"}, kCreated);

    REQUIRE(block.id == id);
    REQUIRE(block.parent_id == parent);
    REQUIRE(block.f_index == idx("OP"));
    REQUIRE(get_kind(block.content) == BlockKind::Paragraph);
    REQUIRE(block.created_at == kCreated);
    REQUIRE(block.updated_at == kCreated);

    SECTION("Fresh identifier") {
        auto fresh = create(std::nullopt, FractionalIndex::start(), Page{"Root"});
        REQUIRE_FALSE(fresh.parent_id.has_value());
        REQUIRE(fresh.id.uuid().version() == 7);
        REQUIRE(fresh.created_at == fresh.updated_at);
    }
}

TEST_CASE("Block transformations are pure", "[blocks]") {
    auto original = create(make_id(0), std::nullopt, idx("OP"), Paragraph{"Original"}, kCreated);

    SECTION("with_content returns new block") {
        auto modified = with_content(original, Paragraph{"Modified"}, kLater);

        REQUIRE(get_text(original.content) == "Original");
        REQUIRE(get_text(modified.content) == "Modified");
        REQUIRE(modified.id == original.id);
        REQUIRE(modified.created_at == kCreated);
        REQUIRE(modified.updated_at == kLater);
    }

    SECTION("with_parent returns new block") {
        auto parent = make_id(1);
        auto modified = with_parent(original, parent, kLater);

        REQUIRE_FALSE(original.parent_id.has_value());
        REQUIRE(modified.parent_id == parent);
        REQUIRE(modified.f_index == original.f_index);
    }
}

TEST_CASE("children_of orders siblings by index", "[blocks]") {
    Tree tree;

    REQUIRE(texts(children_of(tree.page_id, tree.blocks)) ==
            std::vector<std::string>{"first", "second", "third"});
    REQUIRE(texts(root_blocks(tree.blocks)) == std::vector<std::string>{"page", "other page"});
    REQUIRE(children_of(tree.third_id, tree.blocks).empty());

    SECTION("Equal keys fall back to identifier order") {
        auto twin = make_block(make_id(10), tree.page_id, "O!", Paragraph{"twin"});
        tree.blocks.push_back(twin);

        auto children = children_of(tree.page_id, tree.blocks);
        REQUIRE(texts(children) == std::vector<std::string>{"first", "second", "twin", "third"});
    }
}

TEST_CASE("index_for_insert", "[blocks]") {
    Tree tree;
    const auto siblings = children_of(tree.page_id, tree.blocks);

    SECTION("Empty parent gets the middle of the key space") {
        REQUIRE(index_for_insert({}, 0).unwrap().value() == "OP");
        REQUIRE(index_for_insert({}, 5).unwrap().value() == "OP");
    }

    SECTION("Before the first sibling") {
        auto key = index_for_insert(siblings, 0).unwrap();
        REQUIRE(FractionalIndex::start() < key);
        REQUIRE(key < idx("8"));
    }

    SECTION("Between two siblings") {
        auto key = index_for_insert(siblings, 2).unwrap();
        REQUIRE(idx("O") < key);
        REQUIRE(key < idx("f"));
    }

    SECTION("Past the end appends") {
        auto key = index_for_insert(siblings, 3).unwrap();
        REQUIRE(idx("f") < key);
        REQUIRE(key < FractionalIndex::end());
        REQUIRE(index_for_insert(siblings, 99).unwrap() == key);
    }

    SECTION("Appending after a last key at end()") {
        std::vector<ContentBlock> last_at_end{make_block(make_id(20), std::nullopt, "~", Page{"z"})};
        auto key = index_for_insert(last_at_end, 1).unwrap();
        REQUIRE(key.value() == "~OP");
        REQUIRE(FractionalIndex::end() < key);
    }

    SECTION("Nothing fits before a first key at start()") {
        std::vector<ContentBlock> first_at_start{make_block(make_id(20), std::nullopt, "!", Page{"a"})};
        auto key = index_for_insert(first_at_start, 0);
        REQUIRE(key.is_err());
        REQUIRE(key.unwrap_err().kind == ErrorKind::DegenerateInterval);
    }
}

TEST_CASE("move_to reorders without touching siblings", "[blocks]") {
    Tree tree;
    const auto before = tree.blocks;

    SECTION("Move last sibling to the front") {
        auto moved = move_to(tree.get(tree.third_id), tree.page_id, 0, tree.blocks, kLater).unwrap();

        REQUIRE(moved.id == tree.third_id);
        REQUIRE(moved.f_index < idx("8"));
        REQUIRE(moved.updated_at == kLater);
        REQUIRE(moved.created_at == kCreated);

        tree.replace(moved);
        REQUIRE(texts(children_of(tree.page_id, tree.blocks)) ==
                std::vector<std::string>{"third", "first", "second"});

        for (const auto& block : before) {
            if (block.id == tree.third_id) continue;
            REQUIRE(tree.get(block.id) == block);
        }
    }

    SECTION("Move first sibling to the end") {
        auto moved = move_to(tree.get(tree.first_id), tree.page_id, 2, tree.blocks, kLater).unwrap();
        REQUIRE(idx("f") < moved.f_index);

        tree.replace(moved);
        REQUIRE(texts(children_of(tree.page_id, tree.blocks)) ==
                std::vector<std::string>{"second", "third", "first"});
    }

    SECTION("Move to the middle of another parent") {
        auto extra = make_block(make_id(30), tree.other_id, "OP", Paragraph{"extra"});
        auto extra_two = make_block(make_id(31), tree.other_id, "f", Paragraph{"extra two"});
        tree.blocks.push_back(extra);
        tree.blocks.push_back(extra_two);

        auto moved = move_to(tree.get(tree.second_id), tree.other_id, 1, tree.blocks, kLater).unwrap();
        REQUIRE(moved.parent_id == tree.other_id);

        tree.replace(moved);
        REQUIRE(texts(children_of(tree.other_id, tree.blocks)) ==
                std::vector<std::string>{"extra", "second", "extra two"});
        REQUIRE(texts(children_of(tree.page_id, tree.blocks)) ==
                std::vector<std::string>{"first", "third"});

        // Children follow their parent.
        REQUIRE(texts(descendants_of(tree.get(tree.other_id), tree.blocks)) ==
                std::vector<std::string>{"extra", "second", "extra two", "nested"});
    }

    SECTION("Move to the root") {
        auto moved = move_to(tree.get(tree.nested_id), std::nullopt, 0, tree.blocks, kLater).unwrap();
        REQUIRE_FALSE(moved.parent_id.has_value());

        tree.replace(moved);
        REQUIRE(texts(root_blocks(tree.blocks)) ==
                std::vector<std::string>{"nested", "page", "other page"});
    }

    SECTION("Under itself fails") {
        auto moved = move_to(tree.get(tree.second_id), tree.second_id, 0, tree.blocks, kLater);
        REQUIRE(moved.is_err());
        REQUIRE(moved.unwrap_err().kind == ErrorKind::CyclicParent);
    }

    SECTION("Under a descendant fails") {
        auto under_child = move_to(tree.get(tree.page_id), tree.second_id, 0, tree.blocks, kLater);
        REQUIRE(under_child.is_err());
        REQUIRE(under_child.unwrap_err().kind == ErrorKind::CyclicParent);

        auto under_grandchild = move_to(tree.get(tree.page_id), tree.nested_id, 0, tree.blocks, kLater);
        REQUIRE(under_grandchild.is_err());
        REQUIRE(under_grandchild.unwrap_err().kind == ErrorKind::CyclicParent);

        REQUIRE(flatten_tree(tree.blocks).size() == 6);
    }

    SECTION("Under a sibling's subtree is allowed") {
        auto moved = move_to(tree.get(tree.first_id), tree.nested_id, 0, tree.blocks, kLater).unwrap();
        tree.replace(moved);
        REQUIRE(texts(ancestors_of(tree.get(tree.first_id), tree.blocks)) ==
                std::vector<std::string>{"nested", "second", "page"});
        REQUIRE(flatten_tree(tree.blocks).size() == 6);
    }
}

TEST_CASE("Tree traversal", "[blocks]") {
    Tree tree;

    SECTION("ancestors_of lists nearest first") {
        REQUIRE(texts(ancestors_of(tree.get(tree.nested_id), tree.blocks)) ==
                std::vector<std::string>{"second", "page"});
        REQUIRE(ancestors_of(tree.get(tree.page_id), tree.blocks).empty());
    }

    SECTION("descendants_of goes level by level") {
        REQUIRE(texts(descendants_of(tree.get(tree.page_id), tree.blocks)) ==
                std::vector<std::string>{"first", "second", "third", "nested"});
        REQUIRE(descendants_of(tree.get(tree.other_id), tree.blocks).empty());
    }

    SECTION("flatten_tree is depth-first in sibling order") {
        REQUIRE(texts(flatten_tree(tree.blocks)) ==
                std::vector<std::string>{"page", "first", "second", "nested", "third", "other page"});
    }

    SECTION("Cycles terminate") {
        auto a_id = make_id(40);
        auto b_id = make_id(41);
        std::vector<ContentBlock> cyclic{
            make_block(a_id, b_id, "OP", Paragraph{"a"}),
            make_block(b_id, a_id, "OP", Paragraph{"b"}),
        };

        REQUIRE(texts(ancestors_of(cyclic[0], cyclic)) == std::vector<std::string>{"b"});
        REQUIRE(texts(descendants_of(cyclic[0], cyclic)) == std::vector<std::string>{"b"});
        REQUIRE(flatten_tree(cyclic).empty());
    }
}
