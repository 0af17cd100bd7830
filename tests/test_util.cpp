#include "test_util.h"

#include <cstdlib>
#include <iostream>
#include <limits>

#include <stdlib.h>

namespace test {

void ExpectNear(double actual, double expected, const std::string& name, TestContext* ctx) {
  if (std::fabs(actual - expected) <= kEpsilon) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << expected << " got " << actual << "\n";
}

void ExpectTrue(bool value, const std::string& name, TestContext* ctx) {
  if (value) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected true\n";
}

void ExpectEqual(const std::string& actual, const std::string& expected, const std::string& name,
                 TestContext* ctx) {
  if (actual == expected) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected \"" << expected << "\" got \"" << actual << "\"\n";
}

ex::Value ParseText(const std::string& text, rt::Session* session) {
  auto result = ps::Parse(*session, text);
  if (!result.has_value()) {
    return rt::Number::Integer(0);
  }
  return *result;
}

double ParseReal(const std::string& text, rt::Session* session) {
  ex::Value value = ParseText(text, session);
  if (!value.is_number()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return value.number().AsReal();
}

std::set<std::string> Names(std::initializer_list<const char*> names) {
  std::set<std::string> out;
  for (const char* name : names) {
    out.insert(name);
  }
  return out;
}

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
  if (const char* old = std::getenv(name.c_str())) {
    previous_ = std::string(old);
  }
  setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnvVar::~ScopedEnvVar() {
  if (previous_.has_value()) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

}  // namespace test
