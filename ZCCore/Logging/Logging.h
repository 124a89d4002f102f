// PROJECT:       ZaberChain
// SUBSYSTEM:     ZCCore
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include <chrono>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


namespace zc
{
namespace logging
{


enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


// Everything about an entry except its text; filled in by LoggingCore at
// the time the entry is sent.
struct Entry
{
   LogLevel level;
   const char* component;
   std::chrono::system_clock::time_point time;
   std::thread::id threadId;
};


namespace internal
{

// Returns a pointer that stays valid for the life of the process.
const char* InternLabel(const std::string& label);

} // namespace internal


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Entry& entry) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   explicit LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   LogLevel GetMinLevel() const { return minLevel_; }

   virtual bool Filter(const Entry& entry) const
   { return entry.level >= minLevel_; }
};


/**
 * Destination for log entries.
 *
 * Each line is written as
 * "yyyy-mm-ddThh:mm:ss.uuuuuu tid<id> [LVL,component] text". Further lines
 * of a multi-line entry keep only the brackets of the prefix, so the text
 * stays aligned under the first line.
 */
class LogSink
{
   std::mutex mutex_;
   std::shared_ptr<EntryFilter> filter_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter);
   std::shared_ptr<EntryFilter> GetFilter();

   void Consume(const Entry& entry, const std::string& text);

protected:
   virtual std::ostream& Stream() = 0;
   virtual void Flush() {}
};


class StdErrLogSink : public LogSink
{
protected:
   virtual std::ostream& Stream();
   virtual void Flush();
};


class CannotOpenFileException : public std::runtime_error
{
public:
   CannotOpenFileException() :
      std::runtime_error("Cannot open log file")
   {}
};


class FileLogSink : public LogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   FileLogSink(const std::string& filename, bool append = false);

   std::string GetFilename() const { return filename_; }

protected:
   virtual std::ostream& Stream() { return fileStream_; }
   virtual void Flush();
};


class Logger;


/**
 * Dispatches entries from loggers to sinks. Entries are written
 * synchronously on the thread that logs them.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   std::mutex sinksMutex_;
   std::vector<std::shared_ptr<LogSink>> sinks_;

public:
   void AddSink(std::shared_ptr<LogSink> sink);
   void RemoveSink(std::shared_ptr<LogSink> sink);

   Logger NewLogger(const std::string& label);

   void SendEntry(const char* component, LogLevel level,
         const std::string& text);
};


/**
 * Handle to the logging core for one labelled component. Cheap to copy. A
 * default-constructed Logger discards everything.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   const char* label_;

public:
   Logger() : label_("") {}
   Logger(std::shared_ptr<LoggingCore> core, const std::string& label) :
      core_(core),
      label_(internal::InternLabel(label))
   {}

   const char* GetLabel() const { return label_; }

   void operator()(LogLevel level, const std::string& text) const
   {
      if (core_)
         core_->SendEntry(label_, level, text);
   }
};


/**
 * Accumulates one entry through operator<< and sends it on destruction.
 */
class LogStream
{
   Logger logger_;
   LogLevel level_;
   std::ostringstream stream_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger),
      level_(level)
   {}

   // Logging never ends the process; an entry that cannot be written is
   // dropped.
   ~LogStream()
   {
      try
      {
         logger_(level_, stream_.str());
      }
      catch (const std::exception&)
      {
      }
   }

   template <typename T>
   LogStream& operator<<(const T& value)
   {
      stream_ << value;
      return *this;
   }

   LogStream& operator<<(std::ostream& (*manip)(std::ostream&))
   {
      manip(stream_);
      return *this;
   }
};


} // namespace logging
} // namespace zc


#define LOG_TRACE(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelTrace)
#define LOG_DEBUG(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelDebug)
#define LOG_INFO(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelInfo)
#define LOG_WARNING(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelWarning)
#define LOG_ERROR(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelError)
#define LOG_FATAL(logger) \
   ::zc::logging::LogStream((logger), ::zc::logging::LogLevelFatal)
