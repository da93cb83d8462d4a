#include "system.hpp"
#include <grp.h>
#include <pwd.h>
#include <boost/lexical_cast.hpp>
#include <stdexcept>

using namespace std;

int resolve_user(const string &user) {
    int id;
    if (boost::conversion::try_lexical_convert(user, id) && id >= 0) return id;
    struct passwd *pwd = getpwnam(user.c_str());
    if (!pwd) throw runtime_error("unknown user " + user);
    return (int)pwd->pw_uid;
}

int resolve_group(const string &group) {
    int id;
    if (boost::conversion::try_lexical_convert(group, id) && id >= 0) return id;
    struct group *grp = getgrnam(group.c_str());
    if (!grp) throw runtime_error("unknown group " + group);
    return (int)grp->gr_gid;
}
