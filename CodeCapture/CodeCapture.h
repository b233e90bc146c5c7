#ifndef _CodeCapture_CodeCapture_h_
#define _CodeCapture_CodeCapture_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <ctime>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <thread>
#include <regex>
#include <atomic>
#include <chrono>
#include <system_error>
#include <limits>
#include <array>
#include <cerrno>
#include <csignal>
#include <cmath>
#include <utility>
#include <condition_variable>
#include <deque>

// System includes
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <fnmatch.h>

#include "capture_common.h"
#include "utils.h"
#include "json.h"
#include "process.h"
#include "marker.h"
#include "sanitizer.h"
#include "naming.h"
#include "git_repo.h"
#include "resolver.h"
#include "disposition.h"
#include "vcs_sync.h"
#include "sandbox.h"
#include "pipeline.h"
#include "serializer.h"
#include "config.h"
#include "web_server.h"
#include "routes.h"
#include "bundle.h"

#endif
