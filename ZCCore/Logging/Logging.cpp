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

#include "Logging.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <set>


namespace zc
{
namespace logging
{

namespace
{

const char* LevelTag(LogLevel level)
{
   switch (level)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
      default: return "???";
   }
}

// Local time with microseconds, "yyyy-mm-ddThh:mm:ss.uuuuuu"
std::string FormatTimestamp(std::chrono::system_clock::time_point time)
{
   using namespace std::chrono;
   const microseconds sinceEpoch =
      duration_cast<microseconds>(time.time_since_epoch());
   const seconds whole = duration_cast<seconds>(sinceEpoch);
   const long micros = static_cast<long>((sinceEpoch - whole).count());

   std::time_t t = static_cast<std::time_t>(whole.count());
   std::tm local;
   localtime_r(&t, &local);

   char buf[40];
   std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06ld", micros);
   return buf;
}

std::string FormatPrefix(const Entry& entry)
{
   std::ostringstream strm;
   strm << FormatTimestamp(entry.time) << " tid" << entry.threadId <<
      " [" << LevelTag(entry.level) << ',' << entry.component << ']';
   return strm.str();
}

// Blank copy of the prefix that keeps its opening and closing bracket
std::string ContinuationPrefix(const std::string& prefix)
{
   std::string blank(prefix.size(), ' ');
   std::string::size_type open = prefix.find('[');
   if (open != std::string::npos)
      blank[open] = '[';
   if (!blank.empty())
      blank[blank.size() - 1] = ']';
   return blank;
}

} // anonymous namespace


namespace internal
{

const char*
InternLabel(const std::string& label)
{
   // A set never moves the storage of existing elements
   static std::mutex mutex;
   static std::set<std::string> labels;

   std::lock_guard<std::mutex> lock(mutex);
   return labels.insert(label).first->c_str();
}

} // namespace internal


void
LogSink::SetFilter(std::shared_ptr<EntryFilter> filter)
{
   std::lock_guard<std::mutex> lock(mutex_);
   filter_ = filter;
}


std::shared_ptr<EntryFilter>
LogSink::GetFilter()
{
   std::lock_guard<std::mutex> lock(mutex_);
   return filter_;
}


void
LogSink::Consume(const Entry& entry, const std::string& text)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (filter_ && !filter_->Filter(entry))
      return;

   std::ostream& strm = Stream();

   // Split on CR, LF or CRLF; trailing line endings produce no extra line
   std::string::size_type end = text.find_last_not_of("\r\n");
   std::string body = (end == std::string::npos) ? std::string() :
      text.substr(0, end + 1);

   const std::string prefix = FormatPrefix(entry);
   strm << prefix << ' ';
   std::string::size_type pos = 0;
   for (;;)
   {
      std::string::size_type brk = body.find_first_of("\r\n", pos);
      strm << body.substr(pos, brk - pos) << '\n';
      if (brk == std::string::npos)
         break;
      pos = brk + 1;
      if (body[brk] == '\r' && pos < body.size() && body[pos] == '\n')
         ++pos;
      strm << ContinuationPrefix(prefix) << ' ';
   }
   Flush();
}


std::ostream&
StdErrLogSink::Stream()
{
   return std::clog;
}


void
StdErrLogSink::Flush()
{
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename),
   fileStream_(filename.c_str(), append ? std::ios_base::app : std::ios_base::trunc)
{
   if (!fileStream_)
      throw CannotOpenFileException();
}


void
FileLogSink::Flush()
{
   fileStream_.flush();
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(sinksMutex_);
   if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end())
      sinks_.push_back(sink);
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(sinksMutex_);
   sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink),
         sinks_.end());
}


Logger
LoggingCore::NewLogger(const std::string& label)
{
   return Logger(shared_from_this(), label);
}


void
LoggingCore::SendEntry(const char* component, LogLevel level,
      const std::string& text)
{
   Entry entry;
   entry.level = level;
   entry.component = component;
   entry.time = std::chrono::system_clock::now();
   entry.threadId = std::this_thread::get_id();

   std::vector<std::shared_ptr<LogSink>> sinks;
   {
      std::lock_guard<std::mutex> lock(sinksMutex_);
      sinks = sinks_;
   }
   for (std::vector<std::shared_ptr<LogSink>>::iterator it = sinks.begin(),
         end = sinks.end(); it != end; ++it)
   {
      // A failing sink must not keep the entry from the others
      try
      {
         (*it)->Consume(entry, text);
      }
      catch (const std::exception&)
      {
      }
   }
}


} // namespace logging
} // namespace zc
