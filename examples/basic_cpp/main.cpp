#include <hue_log/color_encoder.hpp>
#include <hue_log/sinks/callback_sink.hpp>
#include <hue_log/sinks/console_sink.hpp>
#include <hue_log/sinks/ring_memory_sink.hpp>
#include <hue_log/timestamp.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace
{

class HttpRequest : public hue_log::ILogMarshaler
{
 public:
  HttpRequest(std::string method, std::string path, int status)
      : method_(std::move(method)), path_(std::move(path)), status_(status)
  {
  }

  std::error_code MarshalLog(hue_log::IFieldEmitter& emitter) override
  {
    emitter.AddString("method", method_);
    emitter.AddString("path", path_);
    emitter.AddInt("status", status_);
    return {};
  }

 private:
  std::string method_;
  std::string path_;
  int status_;
};

void report(const char* what, std::error_code ec)
{
  if (ec)
  {
    std::fprintf(stderr, "%s failed: %s\n", what, ec.message().c_str());
  }
}

}  // namespace

int main()
{
  // --- Sink setup ---

  // 1) Console sink, colors auto-detected from the terminal
  hue_log::ConsoleSink console;

  // 2) In-memory ring of the last lines, dumped to a file at exit
  hue_log::RingMemorySink ring(16);

  // 3) Callback sink (custom processing)
  hue_log::CallbackSink alert(
      [](std::string_view line)
      { std::fprintf(stderr, "[ALERT] %zu bytes\n", line.size()); });

  // --- Basic fields ---

  auto enc = hue_log::NewColorEncoder();
  enc->AddString("user", "alice");
  enc->AddInt("attempt", 3);
  enc->AddBool("mfa", true);
  report("login", enc->WriteEntry(&console, "login", hue_log::Level::Info,
                                  hue_log::wall_clock_now_ns()));

  // --- Nested object and generic values ---

  HttpRequest req("GET", "/api/v1/items", 200);
  auto access = hue_log::NewColorEncoder({hue_log::TextTimeFormat(hue_log::kRfc3339MicroLayout),
                                          hue_log::TextUtcTime()});
  report("marshal", access->AddMarshaler("req", req));
  access->AddFloat64("latency_ms", 12.75);
  access->AddObject("tags", std::vector<std::string>{"edge", "cached"});
  access->AddUintptr("conn", 0x7ffd5e8c);
  report("access", access->WriteEntry(&console, "request served", hue_log::Level::Debug,
                                      hue_log::wall_clock_now_ns()));

  // --- Context shared by several entries via Clone ---

  auto base = hue_log::NewColorEncoder({hue_log::TextNoTime()});
  base->AddString("service", "checkout");
  for (int i = 0; i < 3; ++i)
  {
    auto entry = base->Clone();
    entry->AddInt("order", 1000 + i);
    report("order", entry->WriteEntry(&ring, "order placed", hue_log::Level::Warn, 0));
  }

  auto failure = base->Clone();
  failure->AddString("reason", "card declined");
  report("alert", failure->WriteEntry(&alert, "payment failed", hue_log::Level::Error,
                                      hue_log::wall_clock_now_ns()));

  // --- Raw numeric level and null sink ---

  report("raw level", base->WriteEntry(&console, "custom level", static_cast<hue_log::Level>(7),
                                       0));
  report("null sink", base->WriteEntry(nullptr, "dropped", hue_log::Level::Info, 0));

  console.Flush();
  if (!ring.DumpToFile("/tmp/hue_log_example.log"))
  {
    return 1;
  }
  std::printf("ring: %zu lines dumped, pool idle=%zu\n", ring.Size(),
              hue_log::ColorEncoder::Pool().IdleCount());
  return 0;
}
