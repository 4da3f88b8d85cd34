/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrBlackboardArtifact.h"
#include "CorrBlackboard.h"

using namespace std;

CorrBlackboardArtifact::CorrBlackboardArtifact(const uint64_t artifactID, const uint64_t objID, const int artifactTypeID) :
    m_artifactID(artifactID),
    m_objID(objID),
    m_artifactTypeID(artifactTypeID),
    m_attributes()
{
}

CorrBlackboardArtifact::~CorrBlackboardArtifact(){

}

uint64_t CorrBlackboardArtifact::getArtifactID()const{
    return m_artifactID;
}

uint64_t CorrBlackboardArtifact::getObjectID()const{
    return m_objID;
}

int CorrBlackboardArtifact::getArtifactTypeID()const{
    return m_artifactTypeID;
}

string CorrBlackboardArtifact::getArtifactTypeName()const{
    return CorrBlackboard::artTypeIDToTypeName(m_artifactTypeID);
}

string CorrBlackboardArtifact::getDisplayName()const{
    return CorrBlackboard::artTypeIDToDisplayName(m_artifactTypeID);
}

void CorrBlackboardArtifact::addAttribute(const CorrBlackboardAttribute& attr){
    m_attributes.push_back(attr);
}

const vector<CorrBlackboardAttribute>& CorrBlackboardArtifact::getAttributes()const{
    return m_attributes;
}

const CorrBlackboardAttribute * CorrBlackboardArtifact::getAttribute(const int attributeTypeID)const{
    for (vector<CorrBlackboardAttribute>::const_iterator it = m_attributes.begin(); it != m_attributes.end(); ++it) {
        if (it->getAttributeTypeID() == attributeTypeID)
            return &(*it);
    }
    return NULL;
}
