#include <preflop/logging.hpp>

namespace preflop {

std::unique_ptr<Logger> Logger::_instance = nullptr;
std::mutex Logger::_mtx;

}
