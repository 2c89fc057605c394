#include <boxfit/core/analysis.hpp>
#include <gtest/gtest.h>
#include <string>

namespace bc = boxfit::core;

namespace {

bc::Cell text(const char* s) { return bc::Cell{std::string(s)}; }

const bc::ColumnSelection kSelection{"sku", "h", "w", "l"};

bc::Table scenario_table() {
  return bc::Table({"sku", "h", "w", "l", "notes"},
                   {
                       {text("A"), text("10"), text("20"), text("14"), text("x")},
                       {text("B"), text("5"), text("10"), text("abc"), bc::Cell{}},
                       {text("C"), bc::Cell{}, text("20"), text("10"), bc::Cell{}},
                   });
}

std::string str(const bc::Cell& c) { return bc::cell_to_string(c); }

}  // namespace

TEST(Analyze, ConcreteScenario) {
  auto result = bc::analyze(scenario_table(), kSelection, bc::PackagingConstraints{});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->records.size(), 3u);
  EXPECT_EQ(result->records[0].machine_fit, bc::MachineFit::Ok);
  EXPECT_EQ(result->summary.total, 3u);
  EXPECT_EQ(result->summary.ok_count, 1u);
  EXPECT_EQ(result->summary.no_ok_count, 2u);
  EXPECT_DOUBLE_EQ(result->summary.ok_pct, 33.33);
  EXPECT_DOUBLE_EQ(result->summary.no_ok_pct, 66.67);
}

TEST(Analyze, MissingColumnFails) {
  auto result = bc::analyze(scenario_table(), {"sku", "h", "w", "depth"},
                            bc::PackagingConstraints{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), bc::AnalysisError::MissingColumn);
}

TEST(Analyze, InvalidConstraintsFail) {
  bc::PackagingConstraints c;
  c.cardboard_widths = {39.0, 23.0};
  auto result = bc::analyze(scenario_table(), kSelection, c);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), bc::AnalysisError::InvalidConfig);
}

TEST(Analyze, ZeroRowsSucceeds) {
  bc::Table t({"sku", "h", "w", "l"}, {});
  auto result = bc::analyze(t, kSelection, bc::PackagingConstraints{});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->records.empty());
  EXPECT_EQ(result->summary.total, 0u);
  EXPECT_EQ(result->summary.ok_pct, 0.0);
  EXPECT_EQ(result->summary.no_ok_pct, 0.0);
}

TEST(OutputTable, ColumnsAndCells) {
  auto result = bc::analyze(scenario_table(), kSelection, bc::PackagingConstraints{});
  ASSERT_TRUE(result.has_value());
  const bc::Table out = bc::to_output_table(*result);

  ASSERT_EQ(out.column_count(), 7u);
  EXPECT_EQ(out.columns()[0], "Item ID");
  EXPECT_EQ(out.columns()[4], "Volume");
  EXPECT_EQ(out.columns()[6], "Optimal Cardboard Width");
  ASSERT_EQ(out.row_count(), 3u);

  EXPECT_EQ(str(out.at(0, 0)), "A");
  EXPECT_EQ(str(out.at(0, 4)), "2800");
  EXPECT_EQ(str(out.at(0, 5)), "OK");
  EXPECT_EQ(str(out.at(0, 6)), "39");

  EXPECT_TRUE(bc::is_empty(out.at(1, 3)));
  EXPECT_TRUE(bc::is_empty(out.at(1, 4)));
  EXPECT_EQ(str(out.at(1, 5)), "No OK");
  EXPECT_EQ(str(out.at(1, 6)), "23");
  EXPECT_TRUE(std::holds_alternative<std::string>(out.at(1, 6)));

  EXPECT_TRUE(bc::is_empty(out.at(2, 1)));
  EXPECT_EQ(str(out.at(2, 6)), "No Fit");
}

TEST(SummaryTable, MetricRows) {
  bc::Summary s{4, 3, 1, 75.0, 25.0};
  const bc::Table t = bc::to_summary_table(s);
  ASSERT_EQ(t.column_count(), 2u);
  ASSERT_EQ(t.row_count(), 5u);
  EXPECT_EQ(str(t.at(0, 0)), "Total Items");
  EXPECT_EQ(str(t.at(0, 1)), "4");
  EXPECT_EQ(str(t.at(2, 0)), "OK %");
  EXPECT_EQ(str(t.at(2, 1)), "75");
  EXPECT_EQ(str(t.at(4, 0)), "No OK %");
  EXPECT_EQ(str(t.at(4, 1)), "25");
}

TEST(CardboardLabel, Labels) {
  EXPECT_EQ(bc::cardboard_label(23.0), "23");
  EXPECT_EQ(bc::cardboard_label(23.5), "23.5");
  EXPECT_EQ(bc::cardboard_label(std::nullopt), "No Fit");
  EXPECT_EQ(bc::to_label(bc::MachineFit::Ok), "OK");
  EXPECT_EQ(bc::to_label(bc::MachineFit::NoOk), "No OK");
}

TEST(OutputTable, OverflowingVolumeExportsEmpty) {
  bc::Table t({"sku", "h", "w", "l"},
              {{text("A"), text("1e200"), text("1e200"), text("1e200")}});
  auto result = bc::analyze(t, kSelection, bc::PackagingConstraints{});
  ASSERT_TRUE(result.has_value());
  const bc::Table out = bc::to_output_table(*result);
  EXPECT_TRUE(bc::is_empty(out.at(0, 4)));
  EXPECT_EQ(str(out.at(0, 5)), "No OK");
  EXPECT_EQ(str(out.at(0, 6)), "No Fit");
}
