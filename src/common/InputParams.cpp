#include "common/InputParams.h"

namespace
{

template<typename T>
void printOptional(std::ostream& os, const char* label, const std::optional<T>& value)
{
  os << "\n" << label << ": ";

  if (value)
  {
    os << *value;
  }
  else
  {
    os << "<default>";
  }
}

} // namespace

std::ostream& operator<<(std::ostream& os, const InputParams& p)
{
  os << "Tracks file: " << (p.tracksFile ? *p.tracksFile : "<none>");
  os << "\nOutput file: " << (p.outputFile ? *p.outputFile : "<none>");

  printOptional(os, "Current time", p.currentTime);
  printOptional(os, "Current depth", p.currentDepth);
  printOptional(os, "Tail length", p.tailLength);
  printOptional(os, "Head length", p.headLength);

  os << "\nNo depth: " << std::boolalpha << p.noDepth;
  os << "\nFading disabled: " << p.disableFade;
  os << "\nInteractive depth cutoff: " << p.interactive;
  os << "\nReport only: " << p.report;
  os << "\nConsole log level: " << spdlog::level::to_string_view(p.consoleLogLevel).data();

  return os;
}
