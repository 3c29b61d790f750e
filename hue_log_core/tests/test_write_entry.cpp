#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <system_error>

#include "hue_log/ansi.hpp"
#include "hue_log/color_encoder.hpp"
#include "hue_log/error.hpp"
#include "hue_log/sinks/sink_interface.hpp"

using hue_log::ColorEncoder;
using hue_log::Errc;
using hue_log::Level;
using hue_log::NewColorEncoder;

namespace
{

// 2025-02-16 07:50:00.123456 UTC
constexpr uint64_t kFixedNs = 1739692200123456000ULL;

std::string colored_key(std::string_view key)
{
  return "\033[3" + std::to_string(hue_log::key_color(key)) + ";1m" + std::string(key) +
         "\033[0m=";
}

class CaptureSink : public hue_log::IByteSink
{
 public:
  std::string data;
  int write_calls = 0;

  size_t Write(std::string_view bytes, std::error_code&) override
  {
    ++write_calls;
    data.append(bytes.data(), bytes.size());
    return bytes.size();
  }
  void Flush() override {}
};

class ShortWriteSink : public hue_log::IByteSink
{
 public:
  size_t Write(std::string_view bytes, std::error_code&) override
  {
    return bytes.empty() ? 0 : bytes.size() - 1;
  }
  void Flush() override {}
};

class FailingSink : public hue_log::IByteSink
{
 public:
  size_t Write(std::string_view, std::error_code& ec) override
  {
    ec = std::make_error_code(std::errc::no_space_on_device);
    return 0;
  }
  void Flush() override {}
};

class WriteEntryTest : public ::testing::Test
{
 protected:
  void SetUp() override { ColorEncoder::Pool().Clear(); }
};

}  // namespace

TEST_F(WriteEntryTest, LoginScenario)
{
  auto enc = NewColorEncoder({hue_log::TextUtcTime()});
  enc->AddString("user", "alice");

  CaptureSink sink;
  std::error_code ec = enc->WriteEntry(&sink, "login", Level::Info, kFixedNs);
  ASSERT_FALSE(ec) << ec.message();

  EXPECT_EQ(sink.data,
            "\033[34;1m[INFO]\033[0m 2025-02-16T07:50:00Z login                     "
            "\033[37;1muser\033[0m=alice\n");
  EXPECT_EQ(sink.write_calls, 1);
}

TEST_F(WriteEntryTest, NullSinkFailsBeforeAnyBufferWork)
{
  auto enc = NewColorEncoder();
  uint64_t allocs = ColorEncoder::Pool().AllocCount();

  std::error_code ec = enc->WriteEntry(nullptr, "msg", Level::Info, kFixedNs);
  EXPECT_EQ(ec, Errc::InvalidSink);
  EXPECT_EQ(ColorEncoder::Pool().AllocCount(), allocs);
  EXPECT_EQ(ColorEncoder::Pool().ReuseCount(), 0u);
}

TEST_F(WriteEntryTest, EmptyMessageOmitsSegment)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  enc->AddInt("n", 1);

  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "", Level::Warn, kFixedNs));
  EXPECT_EQ(sink.data, "\033[33;1m[WARN]\033[0m " + colored_key("n") + "1\n");
  EXPECT_EQ(sink.data.find("  "), std::string::npos);
}

TEST_F(WriteEntryTest, NoTimeOmitsTimestampAndSeparator)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "hi", Level::Debug, kFixedNs));
  EXPECT_EQ(sink.data, "\033[32;1m[DEBG]\033[0m hi" + std::string(23, ' ') + "\n");
}

TEST_F(WriteEntryTest, LevelTagOnlyWhenEverythingElseEmpty)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "", Level::Error, kFixedNs));
  EXPECT_EQ(sink.data, "\033[31;1m[ERRO]\033[0m\n");
}

TEST_F(WriteEntryTest, MessagePaddedToMinimumWidth)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  enc->AddBool("k", true);
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "abc", Level::Info, kFixedNs));

  std::string expected_msg = "abc" + std::string(22, ' ');
  EXPECT_NE(sink.data.find(" " + expected_msg + " " + colored_key("k")), std::string::npos);
}

TEST_F(WriteEntryTest, LongMessageIsNotTruncated)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  std::string msg(40, 'm');
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, msg, Level::Info, kFixedNs));
  EXPECT_EQ(sink.data, "\033[34;1m[INFO]\033[0m " + msg + "\n");
}

TEST_F(WriteEntryTest, ExactWidthMessageHasNoPadding)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  std::string msg(25, 'x');
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, msg, Level::Info, kFixedNs));
  EXPECT_EQ(sink.data, "\033[34;1m[INFO]\033[0m " + msg + "\n");
}

TEST_F(WriteEntryTest, MessageWidthCountsCharactersNotBytes)
{
  struct Case
  {
    const char* msg;
    size_t pad;
  };
  // 宽字符同样只算一个字符，非法字节各算一个
  for (const auto& c : {Case{"abc", 22}, Case{"caf\xc3\xa9", 21},
                        Case{"\xe6\x97\xa5\xe6\x9c\xac", 23},
                        Case{"\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e\xe3\x81\xae\xe3\x83\xad\xe3\x82\xb0",
                             19},
                        Case{"\xf0\x9f\x93\x9d ok", 21}, Case{"\xff\xfe", 23},
                        Case{"\xe6\x97", 23}, Case{"\xed\xa0\x80", 22}})
  {
    auto enc = NewColorEncoder({hue_log::TextNoTime()});
    CaptureSink sink;
    ASSERT_FALSE(enc->WriteEntry(&sink, c.msg, static_cast<Level>(9), kFixedNs));
    EXPECT_EQ(sink.data, "9 " + std::string(c.msg) + std::string(c.pad, ' ') + "\n") << c.msg;
  }
}

TEST_F(WriteEntryTest, CjkMessageFollowedByFields)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  enc->AddString("user", "alice");
  CaptureSink sink;
  // "登录" 两个字符，补 23 个空格后再接字段分隔空格
  ASSERT_FALSE(enc->WriteEntry(&sink, "\xe7\x99\xbb\xe5\xbd\x95", Level::Info, kFixedNs));
  EXPECT_EQ(sink.data, "\033[34;1m[INFO]\033[0m \xe7\x99\xbb\xe5\xbd\x95" +
                           std::string(24, ' ') + colored_key("user") + "alice\n");
}

TEST_F(WriteEntryTest, AllKnownLevelTags)
{
  struct Case
  {
    Level level;
    const char* prefix;
  };
  for (const auto& c : {Case{Level::Debug, "\033[32;1m[DEBG]\033[0m"},
                        Case{Level::Info, "\033[34;1m[INFO]\033[0m"},
                        Case{Level::Warn, "\033[33;1m[WARN]\033[0m"},
                        Case{Level::Error, "\033[31;1m[ERRO]\033[0m"},
                        Case{Level::Panic, "\033[31;1m[PANC]\033[0m"},
                        Case{Level::Fatal, "\033[31;1m[FATA]\033[0m"}})
  {
    auto enc = NewColorEncoder({hue_log::TextNoTime()});
    CaptureSink sink;
    ASSERT_FALSE(enc->WriteEntry(&sink, "", c.level, kFixedNs));
    EXPECT_EQ(sink.data, std::string(c.prefix) + "\n");
  }
}

TEST_F(WriteEntryTest, UnknownLevelRendersDecimalWithoutColor)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "x", static_cast<Level>(9), kFixedNs));
  EXPECT_EQ(sink.data, "9 x" + std::string(24, ' ') + "\n");

  CaptureSink negative;
  ASSERT_FALSE(enc->WriteEntry(&negative, "", static_cast<Level>(-7), kFixedNs));
  EXPECT_EQ(negative.data, "-7\n");
  EXPECT_EQ(negative.data.find('\033'), std::string::npos);
  EXPECT_EQ(negative.data.find('['), std::string::npos);
}

TEST_F(WriteEntryTest, CustomTimeLayout)
{
  auto enc = NewColorEncoder({hue_log::TextTimeFormat("%H:%M:%S.%f"), hue_log::TextUtcTime()});
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "", Level::Info, kFixedNs));
  EXPECT_EQ(sink.data, "\033[34;1m[INFO]\033[0m 07:50:00.123456\n");
}

TEST_F(WriteEntryTest, DefaultLayoutLocalTime)
{
  auto enc = NewColorEncoder();
  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "", Level::Info, kFixedNs));

  std::regex pattern(
      "\033\\[34;1m\\[INFO\\]\033\\[0m "
      R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(Z|[+-]\d{2}:\d{2})\n)");
  EXPECT_TRUE(std::regex_match(sink.data, pattern)) << sink.data;
}

TEST_F(WriteEntryTest, FieldBufferIsLeftIntact)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  enc->AddString("a", "1");
  std::string before(enc->Bytes());

  CaptureSink first;
  CaptureSink second;
  ASSERT_FALSE(enc->WriteEntry(&first, "m", Level::Info, kFixedNs));
  ASSERT_FALSE(enc->WriteEntry(&second, "m", Level::Info, kFixedNs));

  EXPECT_EQ(enc->Bytes(), before);
  EXPECT_EQ(first.data, second.data);
}

TEST_F(WriteEntryTest, NestedFieldsAppearInLine)
{
  class Pair : public hue_log::ILogMarshaler
  {
   public:
    std::error_code MarshalLog(hue_log::IFieldEmitter& e) override
    {
      e.AddInt("x", 1);
      e.AddInt("y", 2);
      return {};
    }
  };

  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  Pair pair;
  ASSERT_FALSE(enc->AddMarshaler("pt", pair));

  CaptureSink sink;
  ASSERT_FALSE(enc->WriteEntry(&sink, "", Level::Info, kFixedNs));
  EXPECT_EQ(sink.data, "\033[34;1m[INFO]\033[0m " + colored_key("pt") + "{" + colored_key("x") +
                           "1 " + colored_key("y") + "2}\n");
}

TEST_F(WriteEntryTest, ShortWriteIsAnErrorAndBufferIsReleased)
{
  auto enc = NewColorEncoder({hue_log::TextNoTime()});
  enc->AddString("a", "1");
  auto& pool = ColorEncoder::Pool();
  ASSERT_EQ(pool.AllocCount(), 1u);

  ShortWriteSink sink;
  std::error_code ec = enc->WriteEntry(&sink, "m", Level::Info, kFixedNs);
  EXPECT_EQ(ec, Errc::ShortWrite);
  EXPECT_EQ(pool.AllocCount(), 2u);
  EXPECT_EQ(pool.ReleaseCount(), 1u);
  EXPECT_EQ(pool.IdleCount(), 1u);

  // 下一次组装复用同一实例
  ec = enc->WriteEntry(&sink, "m", Level::Info, kFixedNs);
  EXPECT_EQ(ec, Errc::ShortWrite);
  EXPECT_EQ(pool.AllocCount(), 2u);
  EXPECT_EQ(pool.ReuseCount(), 1u);
  EXPECT_EQ(pool.IdleCount(), 1u);
}

TEST_F(WriteEntryTest, SinkErrorIsPropagatedAndBufferIsReleased)
{
  auto enc = NewColorEncoder();
  FailingSink sink;
  std::error_code ec = enc->WriteEntry(&sink, "m", Level::Info, kFixedNs);
  EXPECT_EQ(ec, std::errc::no_space_on_device);
  EXPECT_EQ(ColorEncoder::Pool().ReleaseCount(), 1u);
  EXPECT_EQ(ColorEncoder::Pool().IdleCount(), 1u);
}

TEST_F(WriteEntryTest, SuccessfulWriteReleasesAssemblyBuffer)
{
  auto enc = NewColorEncoder();
  CaptureSink sink;
  for (int i = 0; i < 5; ++i)
  {
    ASSERT_FALSE(enc->WriteEntry(&sink, "m", Level::Info, kFixedNs));
  }
  EXPECT_EQ(ColorEncoder::Pool().AllocCount(), 2u);
  EXPECT_EQ(ColorEncoder::Pool().ReuseCount(), 4u);
  EXPECT_EQ(ColorEncoder::Pool().ReleaseCount(), 5u);
}
