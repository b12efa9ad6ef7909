#ifndef LUMA_LIB_BASE64_HPP
#define LUMA_LIB_BASE64_HPP

#include <string>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  //! RFC 4648 base64 with '=' padding
  std::string base64Encode(const Bytes& data);

  //! Returns false on bad length, bad characters or misplaced padding
  bool base64Decode(const std::string& text, Bytes& out);

} // namespace LumaLib

#endif
