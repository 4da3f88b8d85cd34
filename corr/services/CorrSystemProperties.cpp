/*
 *  The Sleuth Kit
 *
 *  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 *  Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 *  reserved.
 *
 *  This software is distributed under the Common Public License 1.0
 */

#include "CorrSystemProperties.h"

#include "corr/services/CorrServices.h"
#include "corr/utilities/CorrUtilities.h"
#include "corr/utilities/CorrException.h"

#include "Poco/Path.h"
#include "Poco/StringTokenizer.h"
#include "Poco/NumberParser.h"
#include "Poco/LocalDateTime.h"
#include "Poco/DateTimeFormatter.h"

#include <sstream>

namespace
{
    struct PredefinedInfo
    {
        const char *name;
        bool required;
    };

    // Indexed by CorrSystemProperties::PredefinedProperty.
    const PredefinedInfo PREDEFINED[CorrSystemProperties::END_PROPS] =
    {
        { "PROG_DIR", false },
        { "CONFIG_DIR", false },
        { "OUT_DIR", true },
        { "LOG_DIR", false },
        { "EMAIL_ADDRESS_SET_NAME", false },
        { "MIN_PHONE_NUMBER_LENGTH", false },
        { "CURRENT_TIME", false }
    };

    const std::size_t MAX_MACRO_DEPTH = 10;

    std::string subdirOf(const char *macro, const char *name)
    {
        return std::string(macro) + Poco::Path::separator() + name;
    }

    std::string defaultValue(CorrSystemProperties::PredefinedProperty prop)
    {
        switch (prop) {
        case CorrSystemProperties::CONFIG_DIR:
            return subdirOf("#PROG_DIR#", "Config");
        case CorrSystemProperties::LOG_DIR:
            return subdirOf("#OUT_DIR#", "Logs");
        case CorrSystemProperties::EMAIL_ADDRESS_SET_NAME:
            return "Email Addresses";
        case CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH:
            return "6";
        default:
            return "";
        }
    }

    void checkRange(CorrSystemProperties::PredefinedProperty prop, const char *caller)
    {
        if (prop < CorrSystemProperties::PROG_DIR || prop >= CorrSystemProperties::END_PROPS) {
            std::ostringstream msg;
            msg << caller << " : no predefined property " << static_cast<int>(prop);
            throw CorrSystemPropertiesException(msg.str());
        }
    }

    bool findPredefined(const std::string &name, CorrSystemProperties::PredefinedProperty &prop)
    {
        for (int i = 0; i < CorrSystemProperties::END_PROPS; ++i) {
            if (name == PREDEFINED[i].name) {
                prop = static_cast<CorrSystemProperties::PredefinedProperty>(i);
                return true;
            }
        }
        return false;
    }
}

bool CorrSystemProperties::isConfigured() const
{
    for (int i = 0; i < END_PROPS; ++i) {
        if (PREDEFINED[i].required && getProperty(PREDEFINED[i].name).empty())
            return false;
    }
    return true;
}

void CorrSystemProperties::set(PredefinedProperty prop, const std::string &value)
{
    checkRange(prop, "CorrSystemProperties::set");
    set(PREDEFINED[prop].name, value);
}

void CorrSystemProperties::set(const std::string &name, const std::string &value)
{
    if (name.empty()) {
        throw CorrSystemPropertiesException("CorrSystemProperties::set : property name is empty");
    }

    if (name == PREDEFINED[CURRENT_TIME].name) {
        LOGWARN("CorrSystemProperties::set : CURRENT_TIME is read only, value ignored");
        return;
    }

    setProperty(name, value);
}

std::string CorrSystemProperties::rawValue(PredefinedProperty prop) const
{
    checkRange(prop, "CorrSystemProperties::get");

    if (prop == CURRENT_TIME)
        return Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%Y_%m_%d_%H_%M_%S");

    std::string value = getProperty(PREDEFINED[prop].name);
    if (!value.empty())
        return value;

    if (prop == PROG_DIR) {
        // resolved once, then kept
        value = CorrUtilities::getProgDir();
        const_cast<CorrSystemProperties *>(this)->setProperty(PREDEFINED[PROG_DIR].name, value);
        return value;
    }

    value = defaultValue(prop);
    if (value.empty() && PREDEFINED[prop].required) {
        std::ostringstream msg;
        msg << "CorrSystemProperties::get : required system property " << PREDEFINED[prop].name << " is not set";
        throw CorrSystemPropertiesException(msg.str());
    }
    return value;
}

std::string CorrSystemProperties::get(PredefinedProperty prop) const
{
    return expandMacros(rawValue(prop));
}

std::string CorrSystemProperties::get(const std::string &name) const
{
    PredefinedProperty prop;
    if (findPredefined(name, prop))
        return get(prop);
    return expandMacros(getProperty(name));
}

int CorrSystemProperties::getInt(PredefinedProperty prop) const
{
    const std::string value = get(prop);
    int result = 0;
    if (!Poco::NumberParser::tryParse(value, result)) {
        std::ostringstream msg;
        msg << "CorrSystemProperties::getInt : " << PREDEFINED[prop].name << " value '" << value << "' is not an integer";
        throw CorrSystemPropertiesException(msg.str());
    }
    return result;
}

std::string CorrSystemProperties::expandMacros(const std::string &inputStr) const
{
    std::string out;
    expandInto(inputStr, out, 1);
    return out;
}

void CorrSystemProperties::expandInto(const std::string &text, std::string &out, std::size_t depth) const
{
    if (depth > MAX_MACRO_DEPTH) {
        std::ostringstream msg;
        msg << "CorrSystemProperties::expandMacros : macros nested past maximum depth (" << MAX_MACRO_DEPTH
            << "), stopped expanding " << text;
        LOGERROR(msg.str());
        return;
    }

    // "#" separates literal text from property names
    Poco::StringTokenizer pieces(text, "#", Poco::StringTokenizer::TOK_IGNORE_EMPTY);
    for (Poco::StringTokenizer::Iterator piece = pieces.begin(); piece != pieces.end(); ++piece) {
        PredefinedProperty prop;
        if (findPredefined(*piece, prop))
            expandInto(rawValue(prop), out, depth + 1);
        else
            out += *piece;
    }
}
