// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "TeeStream.h"
#include <stdexcept>

namespace wfvalidator
{
  TeeBuf::TeeBuf(const std::vector<std::streambuf*>& branches)
    : mBranches(branches)
  {
    for (auto* branch : mBranches)
      if (branch == nullptr)
	throw std::invalid_argument("TeeBuf: branch stream has no buffer");
  }

  TeeBuf::int_type TeeBuf::overflow(int_type ch)
  {
    if (traits_type::eq_int_type(ch, traits_type::eof()))
      return traits_type::not_eof(ch);

    bool ok = true;
    for (auto* branch : mBranches)
      if (traits_type::eq_int_type(branch->sputc(traits_type::to_char_type(ch)), traits_type::eof()))
	ok = false;

    return ok ? ch : traits_type::eof();
  }

  std::streamsize TeeBuf::xsputn(const char_type* s, std::streamsize count)
  {
    std::streamsize written = count;
    for (auto* branch : mBranches)
      {
	const std::streamsize n = branch->sputn(s, count);
	if (n < written)
	  written = n;
      }

    return written;
  }

  int TeeBuf::sync()
  {
    int result = 0;
    for (auto* branch : mBranches)
      if (branch->pubsync() != 0)
	result = -1;

    return result;
  }

  TeeStream::TeeStream(std::ostream& console, std::ostream& logFile)
    : std::ostream(nullptr),
      mTeeBuf({console.rdbuf(), logFile.rdbuf()})
  {
    rdbuf(&mTeeBuf);
  }
}
