/*
 * sandterm C++ - Site Registry
 *
 * Maps a site id to the folder name that holds the site inside the owner's
 * sandbox. Sites are managed by the hosting panel; sandterm only reads them
 * (upsert_site exists for provisioning scripts and tests).
 */
#ifndef sandterm_SESSION_SITE_REGISTRY_HPP
#define sandterm_SESSION_SITE_REGISTRY_HPP

#include <string>

namespace sandterm {

class Database;

class SiteRegistry {
public:
    virtual ~SiteRegistry() {}

    // True when `site_id` exists and belongs to `user_id`; sets the folder name
    virtual bool lookup(const std::string& site_id, const std::string& user_id,
                        std::string& folder) = 0;
};

class SqliteSiteRegistry : public SiteRegistry {
public:
    explicit SqliteSiteRegistry(Database& db);

    bool ensure_schema();

    bool lookup(const std::string& site_id, const std::string& user_id, std::string& folder);

    bool upsert_site(const std::string& site_id, const std::string& user_id, const std::string& name);

private:
    Database& db_;
};

// A folder name is a single path segment: no separators, not "." or ".."
bool is_safe_folder_name(const std::string& name);

} // namespace sandterm

#endif // sandterm_SESSION_SITE_REGISTRY_HPP
