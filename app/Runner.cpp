#include "Runner.h"
#include "../format/CsvReader.h"
#include "../format/CsvWriter.h"
#include "../format/JsonWriter.h"
#include "../ledger/Processor.h"

#include <fstream>

namespace payproc {

Runner::Runner(std::ostream &output, std::ostream &errors)
    : Module("app"), output_(output), errors_(errors) {}

int Runner::runFile(const std::string &path, const Config &config) {
  std::ifstream input(path);
  if (!input.is_open()) {
    errors_ << "Error: unable to open input file: " << path << "\n";
    return RC_ERROR;
  }
  return run(input, path, config);
}

int Runner::run(std::istream &input, const std::string &sourceName,
                const Config &config) {
  CsvReader reader(input);
  auto header = reader.readHeader();
  if (!header) {
    errors_ << "Error: " << sourceName << ": " << header.error().message
            << "\n";
    return RC_ERROR;
  }

  Processor processor;
  auto report = processor.process(reader);
  if (!report.skipped.empty()) {
    log().info << report.skipped.size() << " of " << report.recordCount
               << " records were skipped";
  }

  if (silent_) {
    return RC_OK;
  }

  Roe<void> written;
  if (config.format == Config::Format::JSON) {
    JsonWriter writer(output_);
    written = writer.write(report.accounts);
  } else {
    CsvWriter writer(output_);
    written = writer.write(report.accounts);
  }
  if (!written) {
    errors_ << "Error: " << written.error().message << "\n";
    return RC_ERROR;
  }
  return RC_OK;
}

} // namespace payproc
