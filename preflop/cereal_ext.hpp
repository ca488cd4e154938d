#pragma once

#include <fstream>
#include <string>
#include <cereal/archives/binary.hpp>
#include <cereal/cereal.hpp>
#include <preflop/logging.hpp>

namespace preflop {

template <class T>
void cereal_save(const T& data, const std::string& fn) {
  Logger::log("Saving to " + fn);
  std::ofstream os(fn, std::ios::binary);
  if(!os.is_open()) Logger::error("Failed to open " + fn + " for writing.");
  cereal::BinaryOutputArchive oarchive(os);
  oarchive(data);
}

template <class T>
T cereal_load(const std::string& fn) {
  Logger::log("Loading from " + fn);
  std::ifstream is(fn, std::ios::binary);
  if(!is.is_open()) Logger::error("Failed to open " + fn + " for reading.");
  cereal::BinaryInputArchive iarchive(is);
  T data;
  iarchive(data);
  return data;
}

}
