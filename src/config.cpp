#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path ISOLATE_PATH = "isolate";
filesystem::path COMPILER_PATH = "/usr/bin/gcc";
int BOX_ID = 0;
filesystem::path STATE_DIR = "/tmp";
size_t DEFAULT_STDIO_MAX_BYTES = 100 * 1024;
bool DEBUG = false;

}  // namespace grader
