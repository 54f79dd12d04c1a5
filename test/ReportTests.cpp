#include <gtest/gtest.h>
#include "ADL/Report.hpp"

using namespace ADL;

TEST(ReportTest, ErrorRendersLabelMessageAndIndentedDetails) {
    auto report = Report::error("Failed to detect connected iOS devices", "first line\nsecond line");
    EXPECT_EQ(report.label(), Report::Label::Error);
    EXPECT_EQ(report.render(),
              "error: Failed to detect connected iOS devices\n"
              "    first line\n"
              "    second line");
}

TEST(ReportTest, EmptyDetailsRenderOnOneLine) {
    auto report = Report::actionRequest("Plug in a device", "");
    EXPECT_EQ(report.label(), Report::Label::ActionRequest);
    EXPECT_EQ(report.render(), "action request: Plug in a device");
}

TEST(ReportTest, LabelNames) {
    EXPECT_EQ(labelToString(Report::Label::Error), "error");
    EXPECT_EQ(labelToString(Report::Label::ActionRequest), "action request");
}
