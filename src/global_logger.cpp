#include "global_logger.hpp"

namespace stderrx {

Logger& global_logger() {
    static Logger logger(Config::from_env());
    return logger;
}

} // namespace stderrx
