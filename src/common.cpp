#include <cerrno>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <sys/stat.h>   // stat / mkdir
#include <unistd.h>     // access
#include <iostream>
#include <iomanip>
#include <algorithm>

#include "common.hpp"

using namespace std;

bool g_verbose = false;


void logI(const string&s){ cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const string&s){ cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const string&s){ cerr<<"[ERR]   "<<s<<'\n'; }


/* ———— 简易文件/目录工具 ———— */
bool file_exists(const std::string& p){
    return ::access(p.c_str(), F_OK) == 0;
}
bool is_directory(const std::string& p){
    struct stat sb{};
    return ::stat(p.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

/* mkdir -p : walk every '/' prefix, EEXIST is fine */
bool make_dirs(const std::string& p){
    if (p.empty()) return false;
    if (is_directory(p)) return true;

    for (size_t pos = p.find('/', 1); ; pos = p.find('/', pos + 1)) {
        const std::string part = p.substr(0, pos);
        if (!part.empty() && !is_directory(part) &&
            ::mkdir(part.c_str(), 0755) != 0 && errno != EEXIST)
            return false;
        if (pos == std::string::npos) break;
    }
    return is_directory(p);
}

std::string join_path(const std::string& dir, const std::string& name){
    if (dir.empty())        return name;
    if (dir.back() == '/')  return dir + name;
    return dir + '/' + name;
}

void progress(const string&tag,size_t cur,size_t tot,size_t W){
    double f=tot?double(cur)/tot:1.0; size_t filled=size_t(f*W);
    cerr<<"\r"<<tag<<" ["<<string(filled,'=')<<string(W-filled,' ')
        <<"] "<<setw(3)<<int(f*100)<<"% ("<<cur<<'/'<<tot<<')'<<flush;
    if(cur==tot) cerr<<'\n';
}


/* ─────────────────────────────  utilities  ────────────────────────────── */
std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b]))     ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return char(std::tolower(c)); });
    return s;
}

std::string join(const std::vector<std::string>& v, const std::string& sep){
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        out += v[i];
        if (i + 1 < v.size()) out += sep;
    }
    return out;
}

double to_number(const std::string& cell){
    const std::string t = trim(cell);
    if (t.empty()) return NaN;

    /* strtod accepts "nan"/"inf"/hex – only plain decimals count */
    for (char c : t)
        if (!(std::isdigit((unsigned char)c) || c=='.' || c=='-' || c=='+' ||
              c=='e' || c=='E'))
            return NaN;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE || !std::isfinite(v))
        return NaN;
    return v;
}
