#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <fstream>
#include <map>
#include <string>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    int getInt(const std::string& section, const std::string& key, int default_value) const;

    void setValue(const std::string& section, const std::string& key, const std::string& value);
    void setBool(const std::string& section, const std::string& key, bool value);
    void setInt(const std::string& section, const std::string& key, int value);

    bool hasValue(const std::string& section, const std::string& key) const;
    bool hasSection(const std::string& section) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
