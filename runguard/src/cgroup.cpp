#include "cgroup.hpp"

#include <fmt/core.h>
#include <libcgroup.h>
#include <cstdlib>

using namespace std;

static string describe_cgroup_error(const string &op, int err) {
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", op, cgroup_strerror(cgroup_get_last_errno()));
    return fmt::format("{}: {}", op, cgroup_strerror(err));
}

cgroup_error::cgroup_error(const string &op, int err)
    : runtime_error(describe_cgroup_error(op, err)) {}

void check_cgroup(const string &op, int err) {
    if (err != 0) throw cgroup_error(op, err);
}

void cgroup_unit::init() {
    check_cgroup("cgroup_init", cgroup_init());
}

cgroup_unit::cgroup_unit(const string &name) : name(name) {
    cg = cgroup_new_cgroup(name.c_str());
    if (!cg)
        throw cgroup_error(fmt::format("cgroup_new_cgroup({})", name), cgroup_get_last_errno());
}

cgroup_unit::~cgroup_unit() {
    cgroup_free(&cg);
}

struct cgroup_controller *cgroup_unit::controller(const string &ctrl, bool create) {
    struct cgroup_controller *result = cgroup_get_controller(cg, ctrl.c_str());
    if (!result && create)
        result = cgroup_add_controller(cg, ctrl.c_str());
    if (!result)
        throw cgroup_error(fmt::format("controller {} of {}", ctrl, name), cgroup_get_last_errno());
    return result;
}

void cgroup_unit::set(const string &ctrl, const string &param, int64_t value) {
    check_cgroup(fmt::format("set {} = {}", param, value),
                 cgroup_add_value_int64(controller(ctrl, true), param.c_str(), value));
}

void cgroup_unit::set(const string &ctrl, const string &param, const string &value) {
    check_cgroup(fmt::format("set {} = {}", param, value),
                 cgroup_add_value_string(controller(ctrl, true), param.c_str(), value.c_str()));
}

void cgroup_unit::enable(const string &ctrl) {
    controller(ctrl, true);
}

int64_t cgroup_unit::read_int64(const string &ctrl, const string &param) {
    int64_t value = 0;
    check_cgroup(fmt::format("read {}", param),
                 cgroup_get_value_int64(controller(ctrl, false), param.c_str(), &value));
    return value;
}

string cgroup_unit::read_string(const string &ctrl, const string &param) {
    char *value = nullptr;
    check_cgroup(fmt::format("read {}", param),
                 cgroup_get_value_string(controller(ctrl, false), param.c_str(), &value));
    string result = value ? value : "";
    free(value);
    return result;
}

void cgroup_unit::create() {
    // ignore_ownership = 1，cgroup 归属 root
    check_cgroup(fmt::format("create {}", name), cgroup_create_cgroup(cg, 1));
}

void cgroup_unit::load() {
    check_cgroup(fmt::format("load {}", name), cgroup_get_cgroup(cg));
}

void cgroup_unit::attach() {
    check_cgroup(fmt::format("attach to {}", name), cgroup_attach_task(cg));
}

void cgroup_unit::remove() {
    check_cgroup(fmt::format("delete {}", name),
                 cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}
