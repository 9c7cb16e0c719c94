#include "core/group_check.hpp"

#include <cstdlib>
#include <vector>

#if defined(_WIN32)

GroupCheck check_group_membership(const std::string& /*group*/) {
    GroupCheck result;
    result.status = GroupStatus::Unsupported;
    result.detail = "group membership is not available on this platform";
    return result;
}

std::string current_user_name() {
    const char* name = std::getenv("USERNAME");
    return name ? name : "";
}

#else

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

std::string current_user_name() {
    for (const char* var : {"LOGNAME", "USER", "LNAME", "USERNAME"}) {
        const char* value = std::getenv(var);
        if (value && value[0] != '\0') return value;
    }
    struct passwd* pw = getpwuid(geteuid());
    return pw ? pw->pw_name : "";
}

GroupCheck check_group_membership(const std::string& group) {
    GroupCheck result;

    struct passwd* pw = getpwuid(geteuid());
    if (!pw) {
        result.status = GroupStatus::Unsupported;
        result.detail = "no passwd entry for uid " + std::to_string(geteuid());
        return result;
    }
    result.user = pw->pw_name;

    errno = 0;
    struct group* gr = getgrnam(group.c_str());
    if (!gr) {
        if (errno != 0 && errno != ENOENT && errno != ESRCH) {
            result.status = GroupStatus::Error;
            result.detail = "cannot look up group '" + group + "': " + std::strerror(errno);
            return result;
        }
        result.status = GroupStatus::NotMember;
        result.detail = "group '" + group + "' does not exist";
        return result;
    }
    gid_t wanted = gr->gr_gid;

    int count = 32;
    std::vector<gid_t> gids(static_cast<size_t>(count));
    // Grow until the whole list fits; getgrouplist reports the needed size
    for (int attempt = 0; attempt < 8; ++attempt) {
        int n = count;
        if (getgrouplist(pw->pw_name, pw->pw_gid, gids.data(), &n) >= 0) {
            gids.resize(static_cast<size_t>(n));
            break;
        }
        if (n <= count) n = count * 2;
        count = n;
        gids.assign(static_cast<size_t>(count), 0);
        if (attempt == 7) {
            result.status = GroupStatus::Error;
            result.detail = "cannot enumerate groups of user '" + result.user + "'";
            return result;
        }
    }

    bool member = std::find(gids.begin(), gids.end(), wanted) != gids.end();
    result.status = member ? GroupStatus::Member : GroupStatus::NotMember;
    return result;
}

#endif
