#include "partstream/multipart-decoder.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "partstream/decode-event.hpp"
#include "partstream/invalid_argument_exception.hpp"
#include "partstream/multipart-decoder-config.hpp"
#include "partstream/multipart-error.hpp"
#include "partstream/vector.hpp"

namespace partstream {

namespace {

constexpr std::string_view kTwoParts =
    "--X\r\n"
    "Content-Disposition: form-data; name=\"field\"\r\n"
    "\r\n"
    "value\r\n"
    "--X\r\n"
    "Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n"
    "Content-Type: text/plain\r\n"
    "\r\n"
    "line1\r\nline2\r\n--Xnot-a-boundary\r\n"
    "\r\n"
    "--X--\r\n";

// Decoding outcome with adjacent body chunks merged, so that it does not depend on how the input was split.
struct Trace {
  bool operator==(const Trace &) const = default;

  std::vector<std::string> events;
  DecodeError feedError{DecodeError::None};
  DecodeError finishError{DecodeError::None};
};

void Record(Trace &trace, const DecodeEvent &event) {
  std::visit(
      [&trace](const auto &evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PartStarted>) {
          std::string str = "start name=" + evt.name;
          str.append(" filename=");
          str.append(evt.filename ? *evt.filename : std::string("<none>"));
          for (const HeaderField &field : evt.headers) {
            str.append(" [").append(field.name).append(": ").append(field.value).append("]");
          }
          trace.events.push_back(std::move(str));
        } else if constexpr (std::is_same_v<T, BodyChunk>) {
          EXPECT_FALSE(evt.data.empty());
          if (!trace.events.empty() && trace.events.back().starts_with("body:")) {
            trace.events.back().append(evt.data);
          } else {
            trace.events.push_back("body:" + evt.data);
          }
        } else {
          trace.events.emplace_back("end");
        }
      },
      event);
}

Trace DecodeChunks(std::string_view boundary, std::initializer_list<std::string_view> chunks,
                   const MultipartDecoderConfig &config = {}) {
  Trace trace;
  MultipartDecoder decoder(boundary, config);
  for (std::string_view chunk : chunks) {
    const auto result = decoder.feed(chunk);
    for (const DecodeEvent &event : result.events) {
      Record(trace, event);
    }
    if (!result.ok()) {
      trace.feedError = result.error;
      return trace;
    }
  }
  trace.finishError = decoder.finish();
  return trace;
}

Trace DecodeWithSplits(std::string_view boundary, std::string_view body, const std::vector<std::size_t> &splits) {
  Trace trace;
  MultipartDecoder decoder(boundary);
  std::size_t pos = 0;
  for (std::size_t idx = 0; idx <= splits.size(); ++idx) {
    const std::size_t end = idx == splits.size() ? body.size() : splits[idx];
    const auto result = decoder.feed(body.substr(pos, end - pos));
    pos = end;
    for (const DecodeEvent &event : result.events) {
      Record(trace, event);
    }
    if (!result.ok()) {
      trace.feedError = result.error;
      return trace;
    }
  }
  trace.finishError = decoder.finish();
  return trace;
}

Trace DecodeWhole(std::string_view boundary, std::string_view body) { return DecodeWithSplits(boundary, body, {}); }

}  // namespace

TEST(MultipartDecoderTest, DecodesTwoParts) {
  const Trace trace = DecodeWhole("X", kTwoParts);
  EXPECT_EQ(trace.feedError, DecodeError::None);
  EXPECT_EQ(trace.finishError, DecodeError::None);
  const std::vector<std::string> expected{
      "start name=field filename=<none> [Content-Disposition: form-data; name=\"field\"]",
      "body:value",
      "end",
      "start name=file filename=a.txt [Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"] "
      "[Content-Type: text/plain]",
      "body:line1\r\nline2\r\n--Xnot-a-boundary\r\n",
      "end",
  };
  EXPECT_EQ(trace.events, expected);
}

TEST(MultipartDecoderTest, PartStartedExposesContentType) {
  MultipartDecoder decoder("X");
  const auto result = decoder.feed(kTwoParts);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 6U);

  const auto *field = std::get_if<PartStarted>(&result.events[0]);
  ASSERT_NE(field, nullptr);
  EXPECT_FALSE(field->contentType().has_value());
  EXPECT_FALSE(field->isFile());

  const auto *file = std::get_if<PartStarted>(&result.events[3]);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->contentType().value_or(""), "text/plain");
  EXPECT_TRUE(file->isFile());
  EXPECT_EQ(file->headers.fields()[1].lowerName(), "content-type");

  EXPECT_TRUE(decoder.terminated());
  EXPECT_FALSE(decoder.done());
  EXPECT_EQ(decoder.partCount(), 2U);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
  EXPECT_TRUE(decoder.done());
}

TEST(MultipartDecoderTest, EveryTwoWaySplitMatchesWholeBody) {
  const Trace whole = DecodeWhole("X", kTwoParts);
  for (std::size_t split = 0; split <= kTwoParts.size(); ++split) {
    EXPECT_EQ(DecodeWithSplits("X", kTwoParts, {split}), whole) << "split at " << split;
  }
}

TEST(MultipartDecoderTest, OneByteChunksMatchWholeBody) {
  const Trace whole = DecodeWhole("X", kTwoParts);
  std::vector<std::size_t> splits;
  for (std::size_t pos = 1; pos < kTwoParts.size(); ++pos) {
    splits.push_back(pos);
  }
  EXPECT_EQ(DecodeWithSplits("X", kTwoParts, splits), whole);
}

TEST(MultipartDecoderTest, RandomSplitsMatchWholeBody) {
  using namespace std::string_view_literals;
  const std::string_view body =
      "preamble to ignore\r\n"
      "--Boundary-42\r\n"
      "Content-Disposition: form-data; name=\"bin\"; filename=\"data.bin\"\r\n"
      "\r\n"
      "\r\n\r\n--Boundary-4\r\n--Boundary-42x\0\xFF\r"
      "\r\n"
      "--Boundary-42  \t\r\n"
      "Content-Disposition: form-data; name=\"t\"\r\n"
      "\r\n"
      "\r\n"
      "--Boundary-42--\r\n"sv;
  const Trace whole = DecodeWhole("Boundary-42", body);
  ASSERT_EQ(whole.finishError, DecodeError::None);
  ASSERT_EQ(whole.events.size(), 5U);

  std::mt19937 gen(42);  // NOLINT(cert-msc32-c,cert-msc51-cpp)
  for (int iter = 0; iter < 200; ++iter) {
    std::uniform_int_distribution<std::size_t> dist(0, body.size());
    std::vector<std::size_t> splits(4);
    for (auto &split : splits) {
      split = dist(gen);
    }
    std::ranges::sort(splits);
    EXPECT_EQ(DecodeWithSplits("Boundary-42", body, splits), whole);
  }
}

TEST(MultipartDecoderTest, DelimiterStraddlingFeedsAtEveryPosition) {
  constexpr std::string_view body =
      "--Straddle\r\n"
      "Content-Disposition: form-data; name=\"a\"\r\n"
      "\r\n"
      "payload\r\n"
      "--Straddle--\r\n";
  const Trace whole = DecodeWhole("Straddle", body);
  const std::size_t markerStart = body.find("\r\n--Straddle--");
  for (std::size_t first = markerStart - 1; first <= body.size(); ++first) {
    for (std::size_t second = first; second <= body.size(); ++second) {
      EXPECT_EQ(DecodeWithSplits("Straddle", body, {first, second}), whole) << first << ' ' << second;
    }
  }
  ASSERT_EQ(whole.events.size(), 3U);
  EXPECT_EQ(whole.events[1], "body:payload");
}

TEST(MultipartDecoderTest, CrlfBeforeDelimiterIsNeverPartOfTheBody) {
  const Trace trace = DecodeChunks("X",
                                   {"--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue\r",
                                    "\n", "--", "X", "--", "\r\n"});
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_EQ(trace.events.size(), 3U);
  EXPECT_EQ(trace.events[1], "body:value");
}

TEST(MultipartDecoderTest, EmptyBody) {
  const Trace trace = DecodeWhole("X", "--X--\r\n");
  EXPECT_TRUE(trace.events.empty());
  EXPECT_EQ(trace.feedError, DecodeError::None);
  EXPECT_EQ(trace.finishError, DecodeError::None);

  MultipartDecoder decoder("X");
  EXPECT_TRUE(decoder.feed("--X--").ok());
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::Closing);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::Done);

  MultipartDecoder complete("X");
  EXPECT_TRUE(complete.feed("--X--\r\n").ok());
  EXPECT_EQ(complete.state(), MultipartDecoder::State::Epilogue);
  EXPECT_EQ(complete.finish(), DecodeError::None);
}

TEST(MultipartDecoderTest, EmptyPartBody) {
  const Trace trace = DecodeWhole("X",
                                  "--X\r\n"
                                  "Content-Disposition: form-data; name=\"empty\"\r\n"
                                  "\r\n"
                                  "\r\n"
                                  "--X--");
  EXPECT_EQ(trace.finishError, DecodeError::None);
  const std::vector<std::string> expected{
      "start name=empty filename=<none> [Content-Disposition: form-data; name=\"empty\"]", "end"};
  EXPECT_EQ(trace.events, expected);
}

constexpr std::string_view kWithPreambleAndEpilogue =
    "This is the preamble. --X is not a delimiter here.\r\n"
    "--X\r\n"
    "Content-Disposition: form-data; name=\"a\"\r\n"
    "\r\n"
    "1\r\n"
    "--X--\r\n"
    "This is the epilogue.\r\n";

TEST(MultipartDecoderTest, PreambleAndEpilogueAreDiscarded) {
  const Trace trace = DecodeWhole("X", kWithPreambleAndEpilogue);
  EXPECT_EQ(trace.feedError, DecodeError::None);
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_EQ(trace.events.size(), 3U);
  EXPECT_EQ(trace.events[1], "body:1");
}

TEST(MultipartDecoderTest, EpilogueIsDiscardedAtEverySplit) {
  const Trace whole = DecodeWhole("X", kWithPreambleAndEpilogue);
  for (std::size_t split = 0; split <= kWithPreambleAndEpilogue.size(); ++split) {
    EXPECT_EQ(DecodeWithSplits("X", kWithPreambleAndEpilogue, {split}), whole) << "split at " << split;
  }

  std::vector<std::size_t> splits;
  for (std::size_t pos = 1; pos < kWithPreambleAndEpilogue.size(); ++pos) {
    splits.push_back(pos);
  }
  EXPECT_EQ(DecodeWithSplits("X", kWithPreambleAndEpilogue, splits), whole);
}

TEST(MultipartDecoderTest, EpilogueFedSeparately) {
  MultipartDecoder decoder("X");
  ASSERT_TRUE(decoder.feed("--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n1\r\n--X--\r\n").ok());
  for (std::string_view chunk : {"epilogue", "\r\n--X\r\n", "--X--\r\n"}) {
    const auto result = decoder.feed(chunk);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.events.empty());
    EXPECT_EQ(decoder.bufferedBytes(), 0U);
  }
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::Epilogue);
  EXPECT_EQ(decoder.partCount(), 1U);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
}

TEST(MultipartDecoderTest, LeadingCrlfBeforeFirstDelimiter) {
  const Trace trace = DecodeWhole("X", "\r\n--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n1\r\n--X--\r\n");
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_EQ(trace.events.size(), 3U);
}

TEST(MultipartDecoderTest, TransportPaddingAfterDelimiters) {
  const Trace trace = DecodeWhole("X", "--X \t\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n1\r\n--X--  \r\n");
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_EQ(trace.events.size(), 3U);
}

TEST(MultipartDecoderTest, FoldedHeaderLine) {
  const Trace trace = DecodeWhole("X",
                                  "--X\r\n"
                                  "Content-Disposition: form-data;\r\n"
                                  "\tname=\"folded\"\r\n"
                                  "\r\n"
                                  "v\r\n"
                                  "--X--\r\n");
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_EQ(trace.events.size(), 3U);
  EXPECT_EQ(trace.events[0], "start name=folded filename=<none> [Content-Disposition: form-data; name=\"folded\"]");
}

TEST(MultipartDecoderTest, FilenameWithEscapedQuote) {
  const Trace trace = DecodeWhole("X",
                                  "--X\r\n"
                                  "Content-Disposition: form-data; name=\"file\"; filename=\"a\\\"b.txt\"\r\n"
                                  "\r\n"
                                  "content\r\n"
                                  "--X--\r\n");
  EXPECT_EQ(trace.finishError, DecodeError::None);
  ASSERT_FALSE(trace.events.empty());
  EXPECT_TRUE(trace.events[0].starts_with("start name=file filename=a\"b.txt ")) << trace.events[0];
}

TEST(MultipartDecoderTest, MissingTerminalDelimiter) {
  MultipartDecoder decoder("X");
  const auto result = decoder.feed("--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\npartial body");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::InBody);
  EXPECT_EQ(decoder.finish(), DecodeError::UnexpectedEof);
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::Failed);
  EXPECT_EQ(decoder.feed("more").error, DecodeError::UnexpectedEof);
  EXPECT_EQ(decoder.finish(), DecodeError::UnexpectedEof);
}

TEST(MultipartDecoderTest, FinishBeforeAnyInput) {
  MultipartDecoder decoder("X");
  EXPECT_EQ(decoder.finish(), DecodeError::UnexpectedEof);
}

TEST(MultipartDecoderTest, FinishInsideHeaders) {
  MultipartDecoder decoder("X");
  EXPECT_TRUE(decoder.feed("--X\r\nContent-Disposition: form").ok());
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::InHeaders);
  EXPECT_EQ(decoder.finish(), DecodeError::UnexpectedEof);
}

TEST(MultipartDecoderTest, MalformedHeaderIsSticky) {
  MultipartDecoder decoder("X");
  const auto result = decoder.feed("--X\r\nContent-Disposition form-data\r\n\r\nvalue\r\n--X--\r\n");
  EXPECT_EQ(result.error, DecodeError::MalformedHeader);
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::Failed);
  EXPECT_EQ(decoder.error(), DecodeError::MalformedHeader);
  EXPECT_EQ(decoder.bufferedBytes(), 0U);

  const auto bytesFed = decoder.bytesFed();
  const auto again = decoder.feed("--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n");
  EXPECT_EQ(again.error, DecodeError::MalformedHeader);
  EXPECT_TRUE(again.events.empty());
  EXPECT_EQ(decoder.bytesFed(), bytesFed);
  EXPECT_EQ(decoder.feed("").error, DecodeError::MalformedHeader);
  EXPECT_EQ(decoder.finish(), DecodeError::MalformedHeader);
}

TEST(MultipartDecoderTest, MissingFieldName) {
  EXPECT_EQ(DecodeWhole("X", "--X\r\nContent-Type: text/plain\r\n\r\nv\r\n--X--\r\n").feedError,
            DecodeError::MissingFieldName);
  EXPECT_EQ(DecodeWhole("X", "--X\r\nContent-Disposition: form-data; filename=\"a\"\r\n\r\nv\r\n--X--\r\n").feedError,
            DecodeError::MissingFieldName);
  EXPECT_EQ(DecodeWhole("X", "--X\r\n\r\nv\r\n--X--\r\n").feedError, DecodeError::MissingFieldName);
}

TEST(MultipartDecoderTest, EventsBeforeErrorAreReturned) {
  MultipartDecoder decoder("X");
  const auto result = decoder.feed(
      "--X\r\n"
      "Content-Disposition: form-data; name=\"ok\"\r\n"
      "\r\n"
      "fine\r\n"
      "--X\r\n"
      "Content-Disposition: attachment\r\n"
      "\r\n");
  EXPECT_EQ(result.error, DecodeError::MalformedHeader);
  ASSERT_EQ(result.events.size(), 3U);
  EXPECT_TRUE(std::holds_alternative<PartStarted>(result.events[0]));
  EXPECT_TRUE(std::holds_alternative<BodyChunk>(result.events[1]));
  EXPECT_TRUE(std::holds_alternative<PartEnded>(result.events[2]));
}

TEST(MultipartDecoderTest, FeedAfterFinishIsAStateViolation) {
  MultipartDecoder decoder("X");
  ASSERT_TRUE(decoder.feed("--X--\r\n").ok());
  EXPECT_TRUE(decoder.terminated());
  EXPECT_FALSE(decoder.done());
  EXPECT_TRUE(decoder.feed("late").ok());
  EXPECT_EQ(decoder.finish(), DecodeError::None);
  EXPECT_TRUE(decoder.done());

  EXPECT_EQ(decoder.feed("later").error, DecodeError::StateViolation);
  EXPECT_TRUE(decoder.done());
  EXPECT_EQ(decoder.feed("").error, DecodeError::None);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
}

TEST(MultipartDecoderTest, ZeroLengthFeedIsANoOp) {
  MultipartDecoder decoder("X");
  const auto result = decoder.feed("");
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(decoder.bytesFed(), 0U);
  EXPECT_EQ(decoder.state(), MultipartDecoder::State::PreBoundary);
}

TEST(MultipartDecoderTest, AppendingFeedVariant) {
  MultipartDecoder decoder("X");
  vector<DecodeEvent> events;
  EXPECT_EQ(decoder.feed("--X\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nab", events), DecodeError::None);
  EXPECT_EQ(decoder.feed("c\r\n--X--", events), DecodeError::None);
  ASSERT_EQ(events.size(), 4U);
  EXPECT_EQ(std::get<BodyChunk>(events[1]).data, "ab");
  EXPECT_EQ(std::get<BodyChunk>(events[2]).data, "c");
  EXPECT_TRUE(std::holds_alternative<PartEnded>(events[3]));
}

TEST(MultipartDecoderTest, RetentionIsBoundedByDelimiterLength) {
  MultipartDecoder decoder("Boundary");
  ASSERT_TRUE(decoder.feed("--Boundary\r\nContent-Disposition: form-data; name=\"big\"\r\n\r\n").ok());
  EXPECT_EQ(decoder.bufferedBytes(), 0U);

  const std::string chunk(64UL * 1024UL, 'a');
  for (int iter = 0; iter < 16; ++iter) {
    const auto result = decoder.feed(chunk);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.events.size(), 1U);
    EXPECT_EQ(decoder.bufferedBytes(), 0U);
  }

  const auto result = decoder.feed("tail\r\n--Bound");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1U);
  EXPECT_EQ(std::get<BodyChunk>(result.events[0]).data, "tail");
  EXPECT_EQ(decoder.bufferedBytes(), std::string_view("\r\n--Bound").size());

  ASSERT_TRUE(decoder.feed("ary--\r\n").ok());
  EXPECT_EQ(decoder.bufferedBytes(), 0U);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
  EXPECT_EQ(decoder.bytesFed(), 16UL * chunk.size() + 78UL);
}

TEST(MultipartDecoderTest, InvalidBoundaryThrows) {
  try {
    MultipartDecoder decoder("");
    FAIL() << "expected multipart_exception";
  } catch (const multipart_exception &ex) {
    EXPECT_EQ(ex.code(), DecodeError::EmptyBoundary);
    EXPECT_STREQ(ex.what(), "multipart boundary is empty");
  }
  try {
    MultipartDecoder decoder(std::string(71, 'b'));
    FAIL() << "expected multipart_exception";
  } catch (const multipart_exception &ex) {
    EXPECT_EQ(ex.code(), DecodeError::BoundaryTooLong);
  }
  EXPECT_NO_THROW(MultipartDecoder(std::string(70, 'b')));
}

TEST(MultipartDecoderTest, InvalidConfigThrows) {
  EXPECT_THROW(MultipartDecoder("X", MultipartDecoderConfig{}.withMaxHeaderBytes(0)), invalid_argument);
  EXPECT_THROW(MultipartDecoder("X", MultipartDecoderConfig{}.withMaxBodyBytes(100).withMaxPartBytes(200)),
               invalid_argument);
  EXPECT_NO_THROW(MultipartDecoder("X", MultipartDecoderConfig{}.withMaxBodyBytes(1U << 20).withMaxPartBytes(1024)));
}

TEST(MultipartDecoderLimitsTest, MaxParts) {
  const Trace trace = DecodeChunks("X", {kTwoParts}, MultipartDecoderConfig{}.withMaxParts(1));
  EXPECT_EQ(trace.feedError, DecodeError::TooManyParts);
  EXPECT_EQ(trace.events.size(), 3U);
  EXPECT_EQ(DecodeChunks("X", {kTwoParts}, MultipartDecoderConfig{}.withMaxParts(0)).finishError, DecodeError::None);
}

TEST(MultipartDecoderLimitsTest, DefaultConfigDoesNotLimitPartsNorHeaders) {
  std::string body;
  for (int idx = 0; idx < 300; ++idx) {
    body.append("--X\r\nContent-Disposition: form-data; name=\"f").append(std::to_string(idx)).append("\"\r\n");
    if (idx == 0) {
      for (int header = 0; header < 100; ++header) {
        body.append("X-Extra-").append(std::to_string(header)).append(": v\r\n");
      }
    }
    body.append("\r\nv\r\n");
  }
  body.append("--X--\r\n");

  MultipartDecoder decoder("X");
  const auto result = decoder.feed(body);
  ASSERT_TRUE(result.ok()) << ErrorMessage(result.error);
  EXPECT_EQ(result.events.size(), 900U);
  ASSERT_TRUE(std::holds_alternative<PartStarted>(result.events[0]));
  EXPECT_EQ(std::get<PartStarted>(result.events[0]).headers.size(), 101U);
  EXPECT_EQ(decoder.partCount(), 300U);
  EXPECT_EQ(decoder.finish(), DecodeError::None);
}

TEST(MultipartDecoderLimitsTest, MaxHeadersPerPart) {
  const Trace trace = DecodeChunks("X", {kTwoParts}, MultipartDecoderConfig{}.withMaxHeadersPerPart(1));
  EXPECT_EQ(trace.feedError, DecodeError::TooManyHeaders);
  EXPECT_EQ(trace.events.size(), 3U);
}

TEST(MultipartDecoderLimitsTest, MaxHeaderBytes) {
  const auto config = MultipartDecoderConfig{}.withMaxHeaderBytes(16);
  EXPECT_EQ(DecodeChunks("X", {kTwoParts}, config).feedError, DecodeError::HeaderTooLarge);

  // without any header terminator in sight
  std::string body = "--X\r\nX-Long: ";
  body.append(100, 'h');
  EXPECT_EQ(DecodeChunks("X", {body}, config).feedError, DecodeError::HeaderTooLarge);
}

TEST(MultipartDecoderLimitsTest, MaxHeaderBytesIsChunkIndependent) {
  const auto config = MultipartDecoderConfig{}.withMaxHeaderBytes(16);
  std::string body = "--X\r\n";
  body.append(32, 'h');
  for (std::size_t split = 0; split <= body.size(); ++split) {
    const std::string_view view(body);
    const Trace trace = DecodeChunks("X", {view.substr(0, split), view.substr(split)}, config);
    EXPECT_EQ(trace.feedError, DecodeError::HeaderTooLarge) << split;
  }
}

TEST(MultipartDecoderLimitsTest, MaxPartBytes) {
  const Trace trace = DecodeChunks("X", {kTwoParts}, MultipartDecoderConfig{}.withMaxPartBytes(4));
  EXPECT_EQ(trace.feedError, DecodeError::PartTooLarge);
  ASSERT_EQ(trace.events.size(), 1U);
  EXPECT_EQ(DecodeChunks("X", {kTwoParts}, MultipartDecoderConfig{}.withMaxPartBytes(64)).finishError,
            DecodeError::None);
}

TEST(MultipartDecoderLimitsTest, MaxBodyBytes) {
  const auto config = MultipartDecoderConfig{}.withMaxBodyBytes(kTwoParts.size() - 1U);
  const Trace trace = DecodeChunks("X", {kTwoParts.substr(0, 10), kTwoParts.substr(10)}, config);
  EXPECT_EQ(trace.feedError, DecodeError::BodyTooLarge);

  const auto exact = MultipartDecoderConfig{}.withMaxBodyBytes(kTwoParts.size());
  EXPECT_EQ(DecodeChunks("X", {kTwoParts}, exact).finishError, DecodeError::None);
}

TEST(MultipartDecoderTest, ErrorMessages) {
  EXPECT_EQ(ErrorMessage(DecodeError::None), "");
  EXPECT_EQ(ErrorMessage(DecodeError::MalformedHeader), "multipart part header is malformed");
  EXPECT_EQ(ErrorMessage(HeaderError::MissingFieldName), "multipart part missing form-data field name");
  EXPECT_EQ(ErrorMessage(DecodeError::UnexpectedEof), "multipart body ended before the terminal boundary");
  EXPECT_EQ(ToDecodeError(HeaderError::Malformed), DecodeError::MalformedHeader);
}

}  // namespace partstream
