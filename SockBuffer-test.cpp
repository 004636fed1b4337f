#include "SockBuffer.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

static std::string temp_file(std::string const& contents, int& fd)
{
  char path[]{"/tmp/SockBuffer-test-XXXXXX"};
  PCHECK((fd = mkstemp(path)) != -1);
  PCHECK(write(fd, contents.data(), contents.size())
         == static_cast<ssize_t>(contents.size()));
  PCHECK(lseek(fd, 0, SEEK_SET) == 0);
  return path;
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const input = std::string("220 relay ready\r\n"
                                 "250-relay\r\n"
                                 "250 8BITMIME\r\n"
                                 "a line with no end");

  int        fd_in;
  auto const in_path = temp_file(input, fd_in);

  int        fd_out;
  auto const out_path = temp_file("", fd_out);

  {
    boost::iostreams::stream<SockBuffer> iostream{fd_in, fd_out, 10s, 10s, 1s};
    CHECK(!iostream->tls());
    CHECK(iostream->tls_info().empty());

    std::string line;
    auto        first = true;
    while (std::getline(iostream, line)) {
      if (!first)
        iostream << '\n';
      iostream << line;
      first = false;
    }
    iostream.clear();
    iostream << std::flush;
    CHECK(!iostream->timed_out());
    iostream->log_totals();
  }

  std::ifstream     out(out_path, std::ios::binary);
  std::string const output{std::istreambuf_iterator<char>(out), {}};
  CHECK_EQ(output, input);

  PCHECK(close(fd_in) == 0);
  PCHECK(close(fd_out) == 0);
  PCHECK(unlink(in_path.c_str()) == 0) << "unlink failed for " << in_path;
  PCHECK(unlink(out_path.c_str()) == 0) << "unlink failed for " << out_path;
}
