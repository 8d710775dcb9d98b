#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <istream>
#include <map>
#include <string>

class IniConfig {
public:
    bool load(const std::string& filename);
    void parse(std::istream& input);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section,
                         const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;
    void removeValue(const std::string& section, const std::string& key);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
