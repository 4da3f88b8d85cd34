/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file CorrBlackboardArtifact.h
 * Contains the definition for the CorrBlackboardArtifact class.
 */

#ifndef _CORR_BLACKBOARD_ARTIFACT_H
#define _CORR_BLACKBOARD_ARTIFACT_H

#include <string>
#include <vector>

#include "corr/corr_i.h"
#include "CorrBlackboardAttribute.h"

/**
 * Class that represents a blackboard artifact: a typed record attached to
 * a piece of content (the object id) holding a flat list of attributes.
 */
class CORR_API CorrBlackboardArtifact
{
public:
    CorrBlackboardArtifact(const uint64_t artifactID, const uint64_t objID, const int artifactTypeID);
    ~CorrBlackboardArtifact();

    /**
    * Get the artifact id for this artifact
    * @returns artifact id
    */
    uint64_t getArtifactID() const;
    /**
    * Get the id of the content this artifact is attached to
    * @returns object id
    */
    uint64_t getObjectID() const;
    /**
    * Get the artifact type id for this artifact
    * @returns artifact type id
    */
    int getArtifactTypeID() const;
    /**
    * Get the artifact type name for this artifact
    * @returns artifact type name
    * @throws CorrNotFoundException if the type id is not a built in type
    */
    std::string getArtifactTypeName() const;
    /**
    * Get the display name for this artifact
    * @returns display name
    * @throws CorrNotFoundException if the type id is not a built in type
    */
    std::string getDisplayName() const;
    /**
    * Add an attribute to this artifact
    * @param attr attribute to be added
    */
    void addAttribute(const CorrBlackboardAttribute& attr);
    /**
    * Get all attributes associated with this artifact, in the order
    * they were added
    * @returns a vector of attributes
    */
    const std::vector<CorrBlackboardAttribute>& getAttributes() const;
    /**
    * Get the first attribute of the given type
    * @param attributeTypeID attribute type id
    * @returns the attribute or NULL if the artifact has none of that type
    */
    const CorrBlackboardAttribute * getAttribute(const int attributeTypeID) const;

private:
    uint64_t m_artifactID;
    uint64_t m_objID;
    int m_artifactTypeID;
    std::vector<CorrBlackboardAttribute> m_attributes;
};

#endif
