// 预编译头文件 (PCH)
// 只放标准库与第三方头文件，项目头文件变动不触发 PCH 重建
#pragma once

// ==================== C++ 标准库 ====================

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <array>
#include <deque>

#include <functional>
#include <optional>
#include <variant>
#include <memory>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <thread>
#include <typeindex>
#include <limits>
#include <coroutine>

#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <random>
#include <stdexcept>
#include <utility>

// ==================== Drogon / Trantor ====================

#include <drogon/drogon.h>
#include <drogon/HttpController.h>
#include <drogon/HttpFilter.h>
#include <drogon/WebSocketController.h>
#include <drogon/HttpClient.h>
#include <drogon/orm/DbClient.h>
#include <drogon/orm/Field.h>
#include <drogon/utils/Utilities.h>
#include <drogon/utils/coroutine.h>

#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/utils/Logger.h>
#include <trantor/utils/AsyncFileLogger.h>

// ==================== 第三方库 ====================

#include <json/json.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
