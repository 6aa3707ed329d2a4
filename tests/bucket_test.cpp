#include "janitor/bucket/bucket.hpp"

#include "test_utils.hpp"

#include <vector>

#include "gtest/gtest.h"

using namespace janitor;
using janitor::test::make_bucket;

namespace {

auto bucket_with(std::string name, std::vector<std::string> extensions,
                 std::vector<std::string> names = {}, std::uint32_t priority = 0)
    -> Bucket {
  return make_bucket(BucketSpec{.name = std::move(name),
                                .destination = "/tmp/dest",
                                .extension_filters = std::move(extensions),
                                .name_filters = std::move(names),
                                .priority = priority});
}

} // namespace

TEST(BucketTest, CreateCompilesEveryNameFilter) {
  auto bucket = bucket_with("b", {}, {"^IMG_", "\\d{4}"});
  EXPECT_EQ(bucket.compiled_filter_count(), 2u);
  EXPECT_EQ(bucket.name(), "b");
  EXPECT_EQ(bucket.action(), Action::Move);
  EXPECT_EQ(bucket.override_action(), OverrideAction::Skip);
}

TEST(BucketTest, InvalidRegexIsParseError) {
  auto bucket = Bucket::create(BucketSpec{.name = "bad", .name_filters = {"("}});
  ASSERT_FALSE(bucket.has_value());
  EXPECT_EQ(bucket.error(), make_error_code(Error::ParseError));
}

TEST(BucketTest, ExtensionMatchesFinalSuffixOnly) {
  auto gz = bucket_with("gz", {"gz"});
  auto tar = bucket_with("tar", {"tar"});
  EXPECT_TRUE(gz.fits("/in/archive.tar.gz"));
  EXPECT_FALSE(tar.fits("/in/archive.tar.gz"));
}

TEST(BucketTest, ExtensionIsCaseSensitiveAndLiteral) {
  auto txt = bucket_with("txt", {"txt"});
  EXPECT_TRUE(txt.fits("notes.txt"));
  EXPECT_FALSE(txt.fits("notes.TXT"));
  EXPECT_FALSE(txt.fits("notes.txt2"));
  EXPECT_FALSE(txt.fits("txt"));
}

TEST(BucketTest, NameFiltersArePartialMatches) {
  auto screenshots = bucket_with("shots", {}, {"Screenshot"});
  EXPECT_TRUE(screenshots.fits("/home/u/Desktop/My Screenshot 2024.png"));
  EXPECT_FALSE(screenshots.fits("/home/u/Desktop/photo.png"));
}

TEST(BucketTest, NameFiltersSeeOnlyTheFinalSegment) {
  auto downloads = bucket_with("dl", {}, {"^Downloads$"});
  EXPECT_FALSE(downloads.fits("/home/u/Downloads/file.bin"));
  EXPECT_TRUE(downloads.fits("/home/u/Downloads"));
  EXPECT_TRUE(downloads.fits("/home/u/Downloads/"));
}

TEST(BucketTest, NameFiltersUsedWhenExtensionMisses) {
  auto both = bucket_with("both", {"pdf"}, {"^invoice"});
  EXPECT_TRUE(both.fits("invoice-march.docx"));
  EXPECT_TRUE(both.fits("report.pdf"));
  EXPECT_FALSE(both.fits("report.docx"));
}

TEST(BucketTest, DirectoriesWithoutExtensionUseNameFilters) {
  auto projects = bucket_with("proj", {"zip"}, {"^project-"});
  EXPECT_TRUE(projects.fits("/in/project-alpha"));
  EXPECT_FALSE(projects.fits("/in/other"));
}

TEST(BucketTest, InvalidUtf8NameNeverFits) {
  auto any = bucket_with("any", {"txt"}, {".*"});
  const std::string bad_name = std::string("bad\xff\xfe") + ".txt";
  EXPECT_FALSE(any.fits(std::filesystem::path("/in") / bad_name));
  EXPECT_TRUE(any.fits("/in/caf\xc3\xa9.txt"));
}

TEST(BucketTest, BacktrackingFilterNeverEscapesFits) {
  auto heavy = bucket_with("heavy", {}, {"^(a|aa)+$"});
  const std::string name = std::string(24, 'a') + "b";
  bool fitted = true;
  EXPECT_NO_THROW(fitted = heavy.fits(std::filesystem::path("/in") / name));
  EXPECT_FALSE(fitted);
  EXPECT_TRUE(heavy.fits("/in/aaaa"));
}

TEST(BucketTest, EmptyPathNeverFits) {
  auto any = bucket_with("any", {}, {".*"});
  EXPECT_FALSE(any.fits(""));
}

TEST(BucketSelectTest, EmptyCandidatesSelectNothing) {
  std::vector<const Bucket *> none;
  EXPECT_EQ(select_bucket(none), nullptr);
}

TEST(BucketSelectTest, HighestPriorityWins) {
  auto low = bucket_with("zzz", {"log"}, {}, 1);
  auto high = bucket_with("aaa", {"log"}, {}, 5);
  std::vector<const Bucket *> candidates{&low, &high};
  EXPECT_EQ(select_bucket(candidates), &high);
}

TEST(BucketSelectTest, EqualPriorityPrefersGreatestName) {
  auto alpha = bucket_with("alpha", {"txt"}, {}, 3);
  auto beta = bucket_with("beta", {"txt"}, {}, 3);
  std::vector<const Bucket *> forward{&alpha, &beta};
  std::vector<const Bucket *> backward{&beta, &alpha};
  EXPECT_EQ(select_bucket(forward), &beta);
  EXPECT_EQ(select_bucket(backward), &beta);
}

TEST(BucketSelectTest, OrderingIsPriorityThenName) {
  auto a0 = bucket_with("a", {}, {}, 0);
  auto b0 = bucket_with("b", {}, {}, 0);
  auto a1 = bucket_with("a", {}, {}, 1);
  EXPECT_TRUE(bucket_less(a0, b0));
  EXPECT_TRUE(bucket_less(b0, a1));
  EXPECT_FALSE(bucket_less(a1, a0));
  EXPECT_FALSE(bucket_less(a0, a0));
}
