#include <cstring>
#include <unistd.h>

#include "io.hh"

using namespace wren;

std::string
wren::describe(Errno err)
{
  return std::string(std::strerror(err)) + " (errno " + std::to_string(err) +
         ")";
}

void
FileDesc::reset()
{
  if (m_fd >= 0)
    ::close(std::exchange(m_fd, -1));
}
