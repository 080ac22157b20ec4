#include "ifacec/naming.hpp"
#include <cctype>
#include <vector>

namespace ifacec {

std::string unraw(const std::string& ident){
    return ident.rfind("r#", 0) == 0 ? ident.substr(2) : ident;
}

static std::vector<std::string> split_underscores(const std::string& s){
    std::vector<std::string> parts; std::string cur;
    for(char c : s){ if(c=='_'){ parts.push_back(cur); cur.clear(); } else cur += c; }
    parts.push_back(cur);
    return parts;
}

std::string to_camel_case(const std::string& s){
    std::string dest;
    auto parts = split_underscores(s);
    size_t first = 0;
    if(!s.empty() && s[0]=='_'){ dest.push_back('_'); first = 1; }
    for(size_t i=first, n=0; i<parts.size(); ++i, ++n){
        const std::string& part = parts[i];
        if(n==0){ dest += part; continue; }
        if(part.empty()) continue;
        dest.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(part[0]))));
        dest += part.substr(1);
    }
    return dest;
}

} // namespace ifacec
