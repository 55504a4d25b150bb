#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scope {
namespace logging {

namespace {

class CapturingLogSink : public LogSink
{
   std::mutex mutex_;
   std::vector<std::string> components_;
   std::vector<LogLevel> levels_;
   std::vector<std::string> lines_;

public:
   virtual void Consume(const Metadata& metadata,
         const std::vector<internal::EntryLine>& lines)
   {
      std::lock_guard<std::mutex> lock(mutex_);
      components_.push_back(metadata.GetLoggerData().GetComponentLabel());
      levels_.push_back(metadata.GetLevel());
      for (const auto& line : lines)
         lines_.push_back(line.text);
   }

   std::vector<std::string> Components()
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return components_;
   }

   std::vector<LogLevel> Levels()
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return levels_;
   }

   std::vector<std::string> Lines()
   {
      std::lock_guard<std::mutex> lock(mutex_);
      return lines_;
   }
};

} // namespace


TEST_CASE("synchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeSynchronous);

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 1000; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("asynchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();

   c->AddSink(std::make_shared<StdErrLogSink>(), SinkModeAsynchronous);

   Logger lgr = c->NewLogger("mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 1000; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("log stream collects one entry", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("Homing");
   LOG_INFO(lgr) << 123 << "ABC" << 456;
   LOG_WARNING(lgr) << "limit not found";

   CHECK(sink->Components() == std::vector<std::string>{ "Homing", "Homing" });
   CHECK(sink->Levels() == std::vector<LogLevel>{ LogLevelInfo, LogLevelWarning });
   CHECK(sink->Lines() == std::vector<std::string>{ "123ABC456", "limit not found" });
}


TEST_CASE("level filter drops lower levels", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   sink->SetFilter(std::make_shared<LevelFilter>(LogLevelInfo));
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("SensorMonitor");
   LOG_TRACE(lgr) << "trace";
   LOG_DEBUG(lgr) << "debug";
   LOG_INFO(lgr) << "info";
   LOG_ERROR(lgr) << "error";

   CHECK(sink->Lines() == std::vector<std::string>{ "info", "error" });
}


TEST_CASE("removed sink receives nothing more", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   c->AddSink(sink, SinkModeSynchronous);

   Logger lgr = c->NewLogger("Core");
   LOG_INFO(lgr) << "before";
   c->RemoveSink(sink, SinkModeSynchronous);
   LOG_INFO(lgr) << "after";

   CHECK(sink->Lines() == std::vector<std::string>{ "before" });
}


TEST_CASE("asynchronous sink is drained on destruction", "[Logger]")
{
   auto sink = std::make_shared<CapturingLogSink>();
   {
      std::shared_ptr<LoggingCore> c =
         std::make_shared<LoggingCore>();
      c->AddSink(sink, SinkModeAsynchronous);
      Logger lgr = c->NewLogger("Autonomous");
      for (int i = 0; i < 100; ++i)
         LOG_DEBUG(lgr) << "entry " << i;
   }
   const auto lines = sink->Lines();
   REQUIRE(lines.size() == 100);
   CHECK(lines.front() == "entry 0");
   CHECK(lines.back() == "entry 99");
}


class LoggerTestThreadFunc
{
   unsigned n_;
   std::shared_ptr<LoggingCore> c_;

public:
   LoggerTestThreadFunc(unsigned n,
         std::shared_ptr<LoggingCore> c) :
      n_(n), c_(c)
   {}

   void Run()
   {
      Logger lgr =
         c_->NewLogger("thread" + std::to_string(n_));
      auto ch = '0' + n_;
      if (ch < '0' || ch > 'z')
         ch = '~';
      for (size_t j = 0; j < 50; ++j)
      {
         LOG_TRACE(lgr) << j << ' ' << std::string(n_ * j, char(ch));
      }
   }
};


TEST_CASE("logger is thread safe", "[Logger]")
{
   std::shared_ptr<LoggingCore> c =
      std::make_shared<LoggingCore>();
   auto sink = std::make_shared<CapturingLogSink>();
   c->AddSink(sink, SinkModeSynchronous);

   std::vector<std::unique_ptr<LoggerTestThreadFunc>> funcs;
   std::vector<std::thread> threads;
   for (unsigned i = 0; i < 10; ++i)
   {
      funcs.emplace_back(std::make_unique<LoggerTestThreadFunc>(i, c));
      threads.emplace_back(&LoggerTestThreadFunc::Run, funcs[i].get());
   }
   for (auto& t : threads)
      t.join();

   CHECK(sink->Components().size() == 500);
}

} // namespace logging
} // namespace scope
