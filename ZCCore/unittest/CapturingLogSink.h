#pragma once

#include "Logging/Logging.h"

#include <sstream>
#include <string>

// Sink that keeps everything written to it in memory. Read Contents() only
// after logging threads have finished.
class CapturingLogSink : public zc::logging::LogSink {
   std::ostringstream stream_;

public:
   std::string Contents() const { return stream_.str(); }

protected:
   std::ostream& Stream() override { return stream_; }
};
