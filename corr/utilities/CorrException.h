/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_EXCEPTION_H
#define _CORR_EXCEPTION_H

#include <stdexcept>
#include <string>

#include "corr/corr_i.h"

/**
 * Root of the exceptions thrown by the correlation library, its case
 * database and its correlation store. Each subclass names the kind of
 * failure; the message says what failed.
 */
class CORR_API CorrException : public std::exception
{
public:
    explicit CorrException(const std::string &msg, int code = 0);
    virtual ~CorrException() throw() {}

    /// Short description of the kind of failure.
    virtual const char *name() const throw();

    /// The message, or name() when there is none.
    virtual const char *what() const throw();

    const std::string &message() const { return m_msg; }
    int code() const { return m_code; }

    /// name() and message() joined as "name: message".
    std::string displayText() const;

protected:
    explicit CorrException(int code);

private:
    std::string m_msg;
    int m_code;
};

// Each kind of failure gets a subclass with its own name().
#define CORR_DECLARE_EXCEPTION(CLS, BASE) \
    class CORR_API CLS : public BASE \
    { \
    public: \
        explicit CLS(int code = 0); \
        explicit CLS(const std::string &msg, int code = 0); \
        const char *name() const throw(); \
    };

#define CORR_IMPLEMENT_EXCEPTION(CLS, BASE, NAME) \
    CLS::CLS(int code) : BASE(code) {} \
    CLS::CLS(const std::string &msg, int code) : BASE(msg, code) {} \
    const char *CLS::name() const throw() { return NAME; }

CORR_DECLARE_EXCEPTION(CorrNotFoundException, CorrException)
CORR_DECLARE_EXCEPTION(CorrCaseClosedException, CorrException)
CORR_DECLARE_EXCEPTION(CorrDatabaseException, CorrException)
CORR_DECLARE_EXCEPTION(CorrCentralRepoException, CorrException)
CORR_DECLARE_EXCEPTION(CorrNormalizationException, CorrException)
CORR_DECLARE_EXCEPTION(CorrSystemPropertiesException, CorrException)
CORR_DECLARE_EXCEPTION(CorrCaseFileException, CorrException)

#endif
