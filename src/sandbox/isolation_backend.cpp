#include "sandbox/isolation_backend.hpp"

namespace grader {
using namespace std;

execution_unit::execution_unit(string id)
    : id(move(id)) {}

execution_unit::~execution_unit() {}

isolation_backend::~isolation_backend() {}

}  // namespace grader
