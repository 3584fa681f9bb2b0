#include "config.hpp"

namespace hackjudge {
using namespace std;

filesystem::path RUN_DIR = "/tmp/hackjudge";
filesystem::path RUNGUARD = "runguard";
bool DEBUG = false;

}  // namespace hackjudge
