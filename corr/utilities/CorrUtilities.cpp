/*
 *
 *  The Sleuth Kit
 *
 *  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 *  Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 *  reserved.
 *
 *  This software is distributed under the Common Public License 1.0
 */

#include "CorrUtilities.h"

#include "Poco/UnicodeConverter.h"
#include "Poco/String.h"
#include "Poco/Path.h"

#include <vector>

#if defined _WIN32 || defined _WIN64
#include <Windows.h>
#elif defined __APPLE__
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

const std::string CorrUtilities::NO_DATA_MD5 = "d41d8cd98f00b204e9800998ecf8427e";

std::string CorrUtilities::toUTF8(const std::wstring &wideStr)
{
    std::string utf8Str;
    Poco::UnicodeConverter::convert(wideStr, utf8Str);
    return utf8Str;
}

namespace {

/// Full path of the running executable, or empty if it cannot be found.
std::string executablePath()
{
#if defined _WIN32 || defined _WIN64
    std::vector<wchar_t> buf(MAX_PATH);
    for (;;) {
        DWORD len = GetModuleFileNameW(NULL, &buf[0], static_cast<DWORD>(buf.size()));
        if (len == 0)
            return "";
        if (len < buf.size())
            return CorrUtilities::toUTF8(std::wstring(&buf[0], len));
        buf.resize(buf.size() * 2);
    }
#elif defined __APPLE__
    uint32_t size = 0;
    _NSGetExecutablePath(NULL, &size);
    std::vector<char> buf(size + 1);
    if (_NSGetExecutablePath(&buf[0], &size) != 0)
        return "";
    return std::string(&buf[0]);
#else
    std::vector<char> buf(256);
    for (;;) {
        ssize_t len = readlink("/proc/self/exe", &buf[0], buf.size());
        if (len < 0)
            return "";
        if (static_cast<size_t>(len) < buf.size())
            return std::string(&buf[0], len);
        buf.resize(buf.size() * 2);
    }
#endif
}

}

std::string CorrUtilities::getProgDir()
{
    std::string exe = executablePath();
    if (exe.empty())
        return exe;
    return Poco::Path(exe).makeParent().toString();
}

bool CorrUtilities::isNoDataMd5(const std::string &md5)
{
    return Poco::icompare(Poco::trim(md5), NO_DATA_MD5) == 0;
}

std::string CorrUtilities::makeFullPath(const std::string &parentPath, const std::string &name)
{
    if (parentPath.empty() || parentPath[parentPath.size() - 1] == '/')
        return parentPath + name;
    return parentPath + "/" + name;
}
