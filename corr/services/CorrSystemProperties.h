/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_SYSTEMPROPERTIES_H
#define _CORR_SYSTEMPROPERTIES_H

#include <string>

#include "corr/corr_i.h"

/**
 * Named string settings shared by the library and the program hosting
 * it, normally reached through CorrServices.
 *
 * A value may refer to a predefined property as #NAME#, e.g. a LOG_DIR
 * of "#OUT_DIR#/Logs". References are expanded when the value is read.
 * Names that are not predefined may be set and read as well; they are
 * not expanded inside other values.
 *
 * Storage is left to subclasses through setProperty() and getProperty().
 */
class CORR_API CorrSystemProperties
{
public:
    enum PredefinedProperty
    {
        PROG_DIR,                   ///< Directory of the running program unless set.
        CONFIG_DIR,                 ///< Default #PROG_DIR#/Config.
        OUT_DIR,                    ///< Required. Root of everything the tools write.
        LOG_DIR,                    ///< Default #OUT_DIR#/Logs.
        EMAIL_ADDRESS_SET_NAME,     ///< Keyword list whose hits are e-mail addresses. Default "Email Addresses".
        MIN_PHONE_NUMBER_LENGTH,    ///< Shortest stripped phone number that is correlated. Default 6.
        CURRENT_TIME,               ///< Read only, formatted as %Y_%m_%d_%H_%M_%S.

        END_PROPS
    };

    CorrSystemProperties() {}
    virtual ~CorrSystemProperties() {}

    /// True when every required predefined property has a value.
    bool isConfigured() const;

    /// Throws CorrSystemPropertiesException if prop is out of range.
    void set(PredefinedProperty prop, const std::string &value);

    /// Throws CorrSystemPropertiesException if name is empty.
    void set(const std::string &name, const std::string &value);

    /**
     * Value of a predefined property with macros expanded, or its default
     * when unset. Throws CorrSystemPropertiesException for a required
     * property that is unset.
     */
    std::string get(PredefinedProperty prop) const;

    /// Value with macros expanded, or an empty string if name is unset.
    std::string get(const std::string &name) const;

    /// Throws CorrSystemPropertiesException if the value is not an integer.
    int getInt(PredefinedProperty prop) const;

    std::string expandMacros(const std::string &inputStr) const;

private:
    virtual void setProperty(const std::string &name, const std::string &value) = 0;

    /// Stored value, or an empty string if name is unset.
    virtual std::string getProperty(const std::string &name) const = 0;

    /// Stored or default value of prop, before macro expansion.
    std::string rawValue(PredefinedProperty prop) const;

    void expandInto(const std::string &text, std::string &out, std::size_t depth) const;
};

#endif
