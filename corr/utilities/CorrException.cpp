/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrException.h"

CorrException::CorrException(int code) : m_msg(), m_code(code)
{
}

CorrException::CorrException(const std::string &msg, int code) : m_msg(msg), m_code(code)
{
}

const char *CorrException::name() const throw()
{
    return "Correlation error";
}

const char *CorrException::what() const throw()
{
    if (m_msg.empty())
        return name();
    return m_msg.c_str();
}

std::string CorrException::displayText() const
{
    if (m_msg.empty())
        return name();
    return std::string(name()) + ": " + m_msg;
}

CORR_IMPLEMENT_EXCEPTION(CorrNotFoundException, CorrException, "Object not found")
CORR_IMPLEMENT_EXCEPTION(CorrCaseClosedException, CorrException, "No case is open")
CORR_IMPLEMENT_EXCEPTION(CorrDatabaseException, CorrException, "Case database error")
CORR_IMPLEMENT_EXCEPTION(CorrCentralRepoException, CorrException, "Correlation store error")
CORR_IMPLEMENT_EXCEPTION(CorrNormalizationException, CorrException, "Correlation value could not be normalized")
CORR_IMPLEMENT_EXCEPTION(CorrSystemPropertiesException, CorrException, "System property error")
CORR_IMPLEMENT_EXCEPTION(CorrCaseFileException, CorrException, "Case file error")
