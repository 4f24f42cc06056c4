#include "Lib.h"

namespace payproc {

Lib::Lib() {}

Lib::~Lib() {}

std::string Lib::getVersion() const { return VERSION; }

} // namespace payproc
