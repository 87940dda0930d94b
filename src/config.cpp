#include "evalbox/config.hpp"

namespace evalbox {
using namespace std;

double DEFAULT_TIME_LIMIT = 2.0;   // 2s
int DEFAULT_MEMORY_LIMIT = 256;    // 256M
int DEFAULT_CONCURRENCY = 8;

filesystem::path RUN_DIR = "/tmp/evalbox";
bool DEBUG = false;

}  // namespace evalbox
