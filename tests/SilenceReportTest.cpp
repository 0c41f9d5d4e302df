#include "detect/errors.hpp"
#include "detect/silence_report.hpp"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <string>

namespace noisedet_test {

using noisedet::isNoiseDetected;
using noisedet::nonSilentChunks;
using noisedet::parseSilenceOutput;

static std::string withFrame(const std::string& body) {
    return std::string(kHeader) + body + kTrailer;
}

TEST(SilenceReportTest, NoMarkersMeansWholeFileIsNoise) {
    auto report = parseSilenceOutput(withFrame(""));
    EXPECT_EQ(report.startMarkers, 0u);
    EXPECT_TRUE(report.silences.empty());
    ASSERT_TRUE(report.totalDuration.has_value());
    EXPECT_DOUBLE_EQ(*report.totalDuration, 10.0);

    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*chunks[0].end, 10.0);
    EXPECT_TRUE(isNoiseDetected(report));
}

TEST(SilenceReportTest, EmptyOutputStillCountsAsNoise) {
    auto report = parseSilenceOutput("");
    EXPECT_EQ(report.startMarkers, 0u);
    EXPECT_FALSE(report.totalDuration.has_value());
    EXPECT_TRUE(isNoiseDetected(report));
}

TEST(SilenceReportTest, QuietGapInsideAudioIsNoise) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x5581a2c0] silence_start: 2.5\n"
        "[silencedetect @ 0x5581a2c0] silence_end: 4.25 | silence_duration: 1.75\n"));

    ASSERT_EQ(report.silences.size(), 1u);
    EXPECT_DOUBLE_EQ(report.silences[0].start, 2.5);
    EXPECT_DOUBLE_EQ(*report.silences[0].end, 4.25);

    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*chunks[0].end, 2.5);
    EXPECT_DOUBLE_EQ(chunks[1].start, 4.25);
    EXPECT_DOUBLE_EQ(*chunks[1].end, 10.0);
    EXPECT_TRUE(isNoiseDetected(report));
}

TEST(SilenceReportTest, SilenceFromStartThatNeverEndsIsNotNoise) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x5581a2c0] silence_start: 0\n"));

    EXPECT_EQ(report.startMarkers, 1u);
    EXPECT_FALSE(report.silences[0].end.has_value());
    EXPECT_TRUE(nonSilentChunks(report).empty());
    EXPECT_FALSE(isNoiseDetected(report));
}

TEST(SilenceReportTest, SilenceClosedAtEndOfStreamIsNotNoise) {
    // Newer ffmpeg closes a trailing silence at EOF.
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x5581a2c0] silence_start: 0\n"
        "[silencedetect @ 0x5581a2c0] silence_end: 10 | silence_duration: 10\n"));

    EXPECT_TRUE(nonSilentChunks(report).empty());
    EXPECT_FALSE(isNoiseDetected(report));
}

TEST(SilenceReportTest, AudioThenTrailingSilence) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x5581a2c0] silence_start: 6.1\n"));

    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*chunks[0].end, 6.1);
    EXPECT_TRUE(isNoiseDetected(report));
}

TEST(SilenceReportTest, UnknownDurationLeavesLastChunkOpen) {
    auto report = parseSilenceOutput(
        "[silencedetect @ 0x1] silence_start: 0\n"
        "[silencedetect @ 0x1] silence_end: 1.5 | silence_duration: 1.5\n");

    EXPECT_FALSE(report.totalDuration.has_value());
    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 1.5);
    EXPECT_FALSE(chunks[0].end.has_value());
    EXPECT_TRUE(isNoiseDetected(report));
}

TEST(SilenceReportTest, CountsEveryStartMarker) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x1] silence_start: 1\n"
        "[silencedetect @ 0x1] silence_end: 2 | silence_duration: 1\n"
        "[silencedetect @ 0x1] silence_start: 3.5\n"
        "[silencedetect @ 0x1] silence_end: 4 | silence_duration: 0.5\n"
        "[silencedetect @ 0x1] silence_start: 8\n"));

    EXPECT_EQ(report.startMarkers, 3u);
    EXPECT_EQ(nonSilentChunks(report).size(), 3u);
}

TEST(SilenceReportTest, ProgressLinesSeparatedByCarriageReturn) {
    auto report = parseSilenceOutput(
        "  Duration: 00:01:00.00, bitrate: 128 kb/s\n"
        "size=N/A time=00:00:12.00 bitrate=N/A speed=900x\r"
        "size=N/A time=00:00:59.50 bitrate=N/A speed=910x\r\n");

    ASSERT_TRUE(report.totalDuration.has_value());
    EXPECT_DOUBLE_EQ(*report.totalDuration, 59.5);
}

TEST(SilenceReportTest, FallsBackToHeaderDuration) {
    auto report = parseSilenceOutput(
        "  Duration: 01:02:03.50, start: 0.000000, bitrate: 128 kb/s\n");
    ASSERT_TRUE(report.totalDuration.has_value());
    EXPECT_DOUBLE_EQ(*report.totalDuration, 3723.5);
}

TEST(SilenceReportTest, IgnoresEndWithoutStart) {
    auto report = parseSilenceOutput(
        "[silencedetect @ 0x1] silence_end: 2 | silence_duration: 2\n");
    EXPECT_EQ(report.startMarkers, 0u);
    EXPECT_TRUE(report.silences.empty());
}

TEST(SilenceReportTest, StartMarkerMustEndTheLine) {
    auto report = parseSilenceOutput("note: silence_start: 1.0 was expected\n");
    EXPECT_EQ(report.startMarkers, 0u);
}

TEST(SilenceReportTest, SlightlyNegativeStartIsClampedToZero) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x1] silence_start: -0.00133333\n"
        "[silencedetect @ 0x1] silence_end: 3 | silence_duration: 3.00133\n"));

    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 3.0);
}

TEST(SilenceReportTest, ReadsExponentTimestamps) {
    // ffmpeg prints tiny timestamps with %g.
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x1] silence_start: 2.26757e-05\n"
        "[silencedetect @ 0x1] silence_end: 1.5e+00 | silence_duration: 1.49998\n"
        "[silencedetect @ 0x1] silence_start: 4E0\n"));

    EXPECT_EQ(report.startMarkers, 2u);
    ASSERT_EQ(report.silences.size(), 2u);
    EXPECT_DOUBLE_EQ(report.silences[0].start, 2.26757e-05);
    ASSERT_TRUE(report.silences[0].end.has_value());
    EXPECT_DOUBLE_EQ(*report.silences[0].end, 1.5);
    EXPECT_DOUBLE_EQ(report.silences[1].start, 4.0);

    auto chunks = nonSilentChunks(report);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 1.5);
    EXPECT_DOUBLE_EQ(*chunks[0].end, 4.0);
}

TEST(SilenceReportTest, ExponentStartAtFileStartIsNotNoise) {
    auto report = parseSilenceOutput(withFrame(
        "[silencedetect @ 0x1] silence_start: 2.26757e-05\n"));

    EXPECT_EQ(report.startMarkers, 1u);
    EXPECT_FALSE(isNoiseDetected(report));
}

} // namespace noisedet_test
