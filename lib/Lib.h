#ifndef PAYPROC_LIB_H
#define PAYPROC_LIB_H

#include <string>

namespace payproc {

class Lib {
public:
  constexpr static const char *VERSION = "0.1.0";

  Lib();
  ~Lib();

  std::string getVersion() const;
};

} // namespace payproc

#endif // PAYPROC_LIB_H
