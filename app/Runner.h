#ifndef PAYPROC_RUNNER_H
#define PAYPROC_RUNNER_H

#include "../lib/Module.h"
#include "Config.h"

#include <istream>
#include <ostream>
#include <string>

namespace payproc {

/**
 * Runner - One run of the command-line tool: read activity records, fold
 * them into accounts and write the snapshot in the configured format.
 *
 * Returns the process exit code. Skipped records do not fail a run; an
 * unreadable input, an unusable header or a failed output stream do.
 * Error messages go to the errors stream, never to the snapshot output.
 */
class Runner : public Module {
public:
  constexpr static int RC_OK = 0;
  constexpr static int RC_ERROR = 1;

  Runner(std::ostream &output, std::ostream &errors);
  ~Runner() override = default;

  // Nothing is written to the output stream when silent is set
  void setSilent(bool silent) { silent_ = silent; }

  int run(std::istream &input, const std::string &sourceName,
          const Config &config);
  int runFile(const std::string &path, const Config &config);

private:
  std::ostream &output_;
  std::ostream &errors_;
  bool silent_{false};
};

} // namespace payproc

#endif // PAYPROC_RUNNER_H
