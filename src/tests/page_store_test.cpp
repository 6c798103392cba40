#include <gtest/gtest.h>
#include <filesystem>
#include <boost/algorithm/string.hpp>
#include "store/page_store.hpp"
#include "test_utils.hpp"

using namespace pagestore;
using namespace pagestore::store;

class PageStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("page_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  StoreOptions options_for(BackendType backend) const {
    StoreOptions options;
    options.root_dir = test_dir;
    options.backend = backend;
    return options;
  }
};

TEST_F(PageStoreTest, FreshStoreHasNothing) {
  for (BackendType backend : {BackendType::SingleFolder, BackendType::MultiFolder}) {
    PageStore store(options_for(backend));
    for (const std::string key : {"", "a", "my/url", "../escape"}) {
      EXPECT_FALSE(store.exists(key)) << "Key: " << key;
      EXPECT_FALSE(store.get(key).has_value()) << "Key: " << key;
    }
  }
}

TEST_F(PageStoreTest, PutThenGetOrderedFields) {
  PageStore store(options_for(BackendType::SingleFolder));
  codec::OrderedFields page = {
    {"title", YAML::Node("foo")},
    {"body", YAML::Node("foo\nbar")}
  };

  store.put("/my/url", page);

  EXPECT_TRUE(store.exists("/my/url"));
  EXPECT_EQ(read_file(test_dir / "my^url.yaml"), "title: foo\nbody: |-\n    foo\n    bar\n");

  auto document = store.get("/my/url");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ((*document)["title"].as<std::string>(), "foo");
  EXPECT_EQ((*document)["body"].as<std::string>(), "foo\nbar");
}

TEST_F(PageStoreTest, PutThenGetMapping) {
  PageStore store(options_for(BackendType::MultiFolder));
  codec::Mapping page = {
    {"title", YAML::Node("Docs")},
    {"author", YAML::Node("someone")}
  };

  store.put("docs/index", page);

  EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / "docs" / "index.yaml"));
  EXPECT_EQ(read_file(test_dir / "docs" / "index.yaml"), "author: someone\ntitle: Docs\n");

  auto document = store.get("docs/index");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ((*document)["title"].as<std::string>(), "Docs");
}

TEST_F(PageStoreTest, PutThenGetList) {
  PageStore store(options_for(BackendType::SingleFolder));
  store.put("numbers", YAML::Load("[1, 2, 3]"));

  auto document = store.get("numbers");
  ASSERT_TRUE(document.has_value());
  ASSERT_TRUE(document->IsSequence());
  EXPECT_EQ(document->size(), 3u);
  EXPECT_EQ((*document)[2].as<int>(), 3);
}

TEST_F(PageStoreTest, MultiLineValuesAreTrimmed) {
  PageStore store(options_for(BackendType::SingleFolder));
  codec::OrderedFields page = {
    {"body", YAML::Node("line  \n\tnext\r\n")}
  };
  store.put("page", page);
  EXPECT_EQ(store.get("page").value()["body"].as<std::string>(), "line\n    next\n");
}

TEST_F(PageStoreTest, TraversalStaysInsideRoot) {
  PageStore store(options_for(BackendType::MultiFolder));
  codec::OrderedFields page = {{"title", YAML::Node("safe")}};

  store.put("../../../a/b/c", page);

  EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / "a" / "b" / "c.yaml"));
  EXPECT_TRUE(store.exists("a/b/c"));
  EXPECT_EQ(store.key_to_path("../../../a/b/c").string(), (test_dir / "a" / "b" / "c.yaml").string());
}

TEST_F(PageStoreTest, FiltersAreAppliedOnRead) {
  StoreOptions options = options_for(BackendType::SingleFolder);
  options.filters = {
    {"upper", [](const std::string& value) { return boost::algorithm::to_upper_copy(value); }},
    {"wrap", [](const std::string& value) { return "[" + value + "]"; }}
  };
  PageStore store(std::move(options));

  codec::OrderedFields page = {
    {"title|upper", YAML::Node("hello")},
    {"body|unknown", YAML::Node("x")},
    {"name|upper|wrap|missing", YAML::Node("abc")}
  };
  store.put("filtered", page);

  // Tags are stored as written
  EXPECT_NE(read_file(test_dir / "filtered.yaml").find("title|upper: hello"), std::string::npos);

  auto document = store.get("filtered");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ((*document)["title"].as<std::string>(), "HELLO");
  EXPECT_EQ((*document)["body|unknown"].as<std::string>(), "x");
  EXPECT_EQ((*document)["name|missing"].as<std::string>(), "[ABC]");
  EXPECT_FALSE((*document)["title|upper"]);
}

TEST_F(PageStoreTest, CorruptDocumentIsAnErrorNotAbsence) {
  PageStore store(options_for(BackendType::SingleFolder));
  write_file(test_dir / "corrupt.yaml", "key: [unclosed\n");

  EXPECT_TRUE(store.exists("corrupt"));
  EXPECT_THROW(store.get("corrupt"), codec::DecodeError);
  EXPECT_FALSE(store.get("missing").has_value());
}

TEST_F(PageStoreTest, MultiDocumentFileIsAnError) {
  PageStore store(options_for(BackendType::SingleFolder));
  write_file(test_dir / "split.yaml", "title: x\n---\nbody: [unclosed\n");

  EXPECT_TRUE(store.exists("split"));
  EXPECT_THROW(store.get("split"), codec::DecodeError);
}

TEST_F(PageStoreTest, EmptyFileIsPresentNullDocument) {
  PageStore store(options_for(BackendType::SingleFolder));
  write_file(test_dir / "blank.yaml", "");

  std::optional<YAML::Node> document = store.get("blank");
  ASSERT_TRUE(document.has_value());
  EXPECT_TRUE(document->IsNull());
}

TEST_F(PageStoreTest, InvalidEncodingIsAbsence) {
  PageStore store(options_for(BackendType::SingleFolder));
  write_file(test_dir / "latin1.yaml", std::string("title: caf\xe9\n"));
  EXPECT_FALSE(store.get("latin1").has_value());
}

TEST_F(PageStoreTest, StoresShareRootDirectory) {
  PageStore writer(options_for(BackendType::MultiFolder));
  PageStore reader(options_for(BackendType::MultiFolder));

  codec::OrderedFields page = {{"title", YAML::Node("shared")}};
  writer.put("shared/page", page);

  auto document = reader.get("shared/page");
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ((*document)["title"].as<std::string>(), "shared");
}

TEST_F(PageStoreTest, CustomExtensionAndDelimiter) {
  StoreOptions options = options_for(BackendType::SingleFolder);
  options.file_extension = ".yml";
  options.path_delimiter = "#";
  PageStore store(std::move(options));

  EXPECT_EQ(store.key_to_path("a/b/c").string(), (test_dir / "a#b#c.yml").string());
}

TEST_F(PageStoreTest, BackendTypeParsing) {
  EXPECT_EQ(parse_backend_type("single"), BackendType::SingleFolder);
  EXPECT_EQ(parse_backend_type("multi"), BackendType::MultiFolder);
  EXPECT_THROW(parse_backend_type("nested"), ConfigError);
  EXPECT_STREQ(backend_type_to_string(BackendType::MultiFolder), "multi");
}

TEST_F(PageStoreTest, InvalidDelimiterFailsConstruction) {
  StoreOptions options = options_for(BackendType::SingleFolder);
  options.path_delimiter = "/";
  EXPECT_THROW(PageStore store(std::move(options)), ConfigError);
}
