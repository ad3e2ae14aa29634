#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "ts_decode/basic/diagnostic.hpp"
#include "ts_decode/basic/diagnostic_printer.hpp"
#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/decode/error.hpp"
#include "ts_decode/decode/error_report.hpp"

using ts_decode::DecodeError;
using ts_decode::DiagnosticBag;
using ts_decode::DiagnosticPrinter;
using ts_decode::report;
using ts_decode::SourceManager;
using ts_decode::SourceRange;
using ts_decode::to_diagnostic;

namespace
{

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(DiagnosticPrinter, MarksStructuralErrorSpan)
{
  const SourceManager sm("[1,\n  4.5 4.6]\n");
  const auto diag = to_diagnostic(DecodeError::structural({SourceRange(10, 13)}));

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(diag, sm);
  const std::string out = os.str();

  EXPECT_EQ(out.rfind("error[D0007]: source tree contains 1 syntax error(s)\n", 0), 0u) << out;
  EXPECT_TRUE(contains(out, "  --> <input>:2:7\n")) << out;
  EXPECT_TRUE(contains(out, "    2 |   4.5 4.6]\n")) << out;
  EXPECT_TRUE(contains(out, "      |       ^^^ syntax error\n")) << out;
  EXPECT_TRUE(contains(out, "   = help: decode without error checking to accept partial trees\n"))
    << out;
}

TEST(DiagnosticPrinter, UsesFilePathWhenKnown)
{
  const SourceManager sm("data/input.json", "true");
  const auto diag = to_diagnostic(DecodeError::boolean("ture"), SourceRange(0, 4));

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(diag, sm);

  EXPECT_TRUE(contains(os.str(), "  --> data/input.json:1:1\n")) << os.str();
  EXPECT_TRUE(contains(os.str(), "^^^^ while decoding this node")) << os.str();
}

TEST(DiagnosticPrinter, ErrorWithoutLocation)
{
  const SourceManager sm("x");
  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(to_diagnostic(DecodeError::custom("no shape")), sm);

  EXPECT_EQ(os.str().rfind("error[D0008]: no shape\n  --> <input>\n", 0), 0u) << os.str();
}

TEST(DiagnosticPrinter, PrintAllOrdersByLocation)
{
  const SourceManager sm("aaa bbb");
  DiagnosticBag bag;
  report(bag, DecodeError::custom("second"), SourceRange(4, 7));
  report(bag, DecodeError::custom("first"), SourceRange(0, 3));

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(bag, sm);
  const std::string out = os.str();

  const auto first = out.find("first");
  const auto second = out.find("second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}
