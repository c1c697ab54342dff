#include <gtest/gtest.h>
#include <fstream>
#include "document_store.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace pulse_rag;

namespace {

Document make_doc(const std::string& content, const std::string& module = "") {
    Document doc;
    doc.content = content;
    doc.module = module;
    return doc;
}

} // namespace

TEST(DocumentStoreTest, AppendStampsPositions) {
    DocumentStore store;
    EXPECT_EQ(store.append(make_doc("first")), 0);
    EXPECT_EQ(store.append(make_doc("second")), 1);
    EXPECT_EQ(store.count(), 2);
    EXPECT_EQ(store.get(1).content, "second");
    EXPECT_EQ(store.get(1).position, 1);
}

TEST(DocumentStoreTest, GetOutOfRangeThrows) {
    DocumentStore store;
    store.append(make_doc("only"));
    EXPECT_THROW(store.get(1), std::out_of_range);
    EXPECT_THROW(store.get(-1), std::out_of_range);
}

TEST(DocumentStoreTest, SaveAndLoadKeepsEveryField) {
    test_support::TempDir dir;
    auto file = (dir / "documents.json").string();

    DocumentStore store;
    Document doc = make_doc("Camera crashes on zoom", "Camera");
    doc.sub_module = "Zoom";
    doc.issue_type = "Crash";
    doc.sub_issue_type = "ANR";
    doc.source = "Beta";
    store.append(doc);
    store.append(make_doc("Battery drains fast", "Battery"));
    store.save(file);

    DocumentStore restored;
    restored.load(file);
    ASSERT_EQ(restored.count(), 2);
    const Document& first = restored.get(0);
    EXPECT_EQ(first.content, "Camera crashes on zoom");
    EXPECT_EQ(first.module, "Camera");
    EXPECT_EQ(first.sub_module, "Zoom");
    EXPECT_EQ(first.issue_type, "Crash");
    EXPECT_EQ(first.sub_issue_type, "ANR");
    EXPECT_EQ(first.source, "Beta");
    EXPECT_EQ(restored.get(1).source, "Unknown");
}

TEST(DocumentStoreTest, LoadRejectsMisnumberedPositionsAndKeepsContents) {
    test_support::TempDir dir;
    auto file = dir / "documents.json";
    {
        std::ofstream out(file);
        out << R"([{"content": "a", "position": 0}, {"content": "b", "position": 5}])";
    }

    DocumentStore store;
    store.append(make_doc("existing"));
    EXPECT_THROW(store.load(file.string()), std::runtime_error);
    ASSERT_EQ(store.count(), 1);
    EXPECT_EQ(store.get(0).content, "existing");
}

TEST(DocumentTest, FilterIsExactMatchConjunction) {
    Document doc = make_doc("Camera crashes on zoom", "Camera");
    doc.issue_type = "Crash";
    doc.source = "A";

    EXPECT_TRUE(matches_filter(doc, {}));
    EXPECT_TRUE(matches_filter(doc, {{"module", "Camera"}}));
    EXPECT_TRUE(matches_filter(doc, {{"module", "Camera"}, {"issue_type", "Crash"}, {"source", "A"}}));
    EXPECT_FALSE(matches_filter(doc, {{"module", "camera"}}));
    EXPECT_FALSE(matches_filter(doc, {{"module", "Camera"}, {"issue_type", "Lag"}}));
    EXPECT_FALSE(matches_filter(doc, {{"severity", "High"}}));
}

TEST(DocumentTest, RawDocumentFromJsonKeepsMissingFieldsUnset) {
    auto raw = RawDocument::from_json(nlohmann::json{{"content", "Battery drains fast"}, {"module", "Battery"}});
    EXPECT_EQ(raw.content, "Battery drains fast");
    EXPECT_EQ(raw.module.value_or("?"), "Battery");
    EXPECT_FALSE(raw.sub_module.has_value());
    EXPECT_FALSE(raw.source.has_value());

    EXPECT_EQ(RawDocument::from_json(nlohmann::json::object()).content, "");
    EXPECT_THROW(RawDocument::from_json(nlohmann::json{{"content", 42}}), ValidationError);
    EXPECT_THROW(RawDocument::from_json(nlohmann::json::array()), ValidationError);
}

TEST(DocumentTest, BlankDetection) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\n"));
    EXPECT_FALSE(is_blank(" x "));
}
