#include "internal.h"

#include <git2.h>

#include <string>

namespace gitshort {
namespace git {

[[noreturn]] void throw_error(const std::string& context) {
    throw GitError(context + ": " + last_error());
}

std::string last_error(const std::string& fallback) {
    const git_error* e = git_error_last();
    if (e && e->message) return e->message;
    return fallback;
}

std::string oid_hex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

git_oid hex_to_oid(const std::string& hex) {
    git_oid oid;
    if (hex.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, hex.c_str()) != 0) {
        throw InvalidIdError(hex);
    }
    return oid;
}

std::string ref_target(git_repository* repo, const std::string& refname) {
    git_oid oid;
    int rc = git_reference_name_to_id(&oid, repo, refname.c_str());
    if (rc == GIT_ENOTFOUND) return {};
    if (rc != 0) throw_error("git_reference_name_to_id (" + refname + ")");
    return oid_hex(&oid);
}

git_signature* make_signature(git_repository* repo,
                              const std::optional<Signature>& explicit_sig) {
    git_signature* sig = nullptr;
    if (explicit_sig) {
        if (git_signature_now(&sig, explicit_sig->name.c_str(),
                              explicit_sig->email.c_str()) != 0)
            throw_error("git_signature_now");
        return sig;
    }

    // user.name / user.email from the repository configuration
    if (git_signature_default(&sig, repo) == 0) return sig;

    Signature fallback;
    if (git_signature_now(&sig, fallback.name.c_str(),
                          fallback.email.c_str()) != 0)
        throw_error("git_signature_now");
    return sig;
}

} // namespace git
} // namespace gitshort
