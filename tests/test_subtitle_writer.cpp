/**
 * @file test_subtitle_writer.cpp
 * @brief ASS rendering of timing maps
 */

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voicesync/subtitle_writer.hpp"
#include "voicesync/timing_map_builder.hpp"

using namespace voicesync;
using namespace voicesync::test;

namespace {

TimingMap hello_world() {
  Phrase p;
  p.text = "hello world";
  p.start = 0.0;
  p.end = 2.0;
  p.words = {{0, 0.0}, {1, 0.8}};

  TimingMap map;
  map.track_duration = 2.0;
  map.phrases.push_back(p);
  return map;
}

size_t count_lines_with(const std::string &doc, const std::string &prefix) {
  std::istringstream in(doc);
  std::string line;
  size_t n = 0;
  while (std::getline(in, line)) {
    if (line.rfind(prefix, 0) == 0)
      ++n;
  }
  return n;
}

} // namespace

TEST(FormatAssTime, Centiseconds) {
  EXPECT_EQ(format_ass_time(0.0), "0:00:00.00");
  EXPECT_EQ(format_ass_time(3661.5), "1:01:01.50");
  EXPECT_EQ(format_ass_time(59.996), "0:01:00.00");
  EXPECT_EQ(format_ass_time(-1.0), "0:00:00.00");
}

TEST(AssDisplayText, UppercasesAndNeutralizesOverrides) {
  EXPECT_EQ(ass_display_text("a{b}\\c\nd"), "A(B)/C D");
  EXPECT_EQ(ass_display_text("caf\xc3\xa9"), "CAF\xc3\xa9");
}

TEST(RenderAss, PhraseLayerAndHighlightLayer) {
  const TimingMap map = hello_world();
  const std::string doc = render_ass(map);

  EXPECT_NE(doc.find("[Script Info]"), std::string::npos);
  EXPECT_NE(doc.find("[Events]"), std::string::npos);
  EXPECT_NE(doc.find("Dialogue: 0,0:00:00.00,0:00:02.00,White,,0,0,0,,"
                     "HELLO WORLD\n"),
            std::string::npos);
  EXPECT_NE(doc.find("Dialogue: 1,0:00:00.00,0:00:00.80,White,,0,0,0,,"
                     "{\\c&H00FFFF&}HELLO{\\c&HFFFFFF&} WORLD\n"),
            std::string::npos);
  EXPECT_NE(doc.find("Dialogue: 1,0:00:00.80,0:00:02.00,White,,0,0,0,,"
                     "HELLO {\\c&H00FFFF&}WORLD{\\c&HFFFFFF&}\n"),
            std::string::npos);

  EXPECT_EQ(count_lines_with(doc, "Dialogue: 0,"), map.phrases.size());
  EXPECT_EQ(count_lines_with(doc, "Dialogue: 1,"), to_cues(map).size());
}

TEST(RenderAss, EmptyMapHasNoEvents) {
  const std::string doc = render_ass(TimingMap{});
  EXPECT_EQ(count_lines_with(doc, "Dialogue:"), 0u);
}

TEST(WriteAssFile, ReportsUnwritablePath) {
  TempDir dir;
  EXPECT_EQ(write_ass_file(hello_world(), dir.file("subs.ass")),
            ErrorCode::Ok);
  EXPECT_EQ(read_file(dir.file("subs.ass")), render_ass(hello_world()));
  EXPECT_EQ(write_ass_file(hello_world(), dir.file("no/such/subs.ass")),
            ErrorCode::IoFailure);
}
