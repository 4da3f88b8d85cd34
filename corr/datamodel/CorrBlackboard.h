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
 * \file CorrBlackboard.h
 * Built in artifact and attribute types of the blackboard data model and
 * the tables that map their ids to names.
 */

#ifndef _CORR_BLACKBOARD_H
#define _CORR_BLACKBOARD_H

#include <string>
#include <map>
#include "corr/corr_i.h"

/**
 * Built in artifact types.
 *
 * The numbers are explicitly added to make it easier to verify
 * that they match the ids stored in case databases. Do not renumber.
 */
enum ARTIFACT_TYPE {
    ART_GEN_INFO = 1,///< The general info artifact, if information doesn't need its own artifact it should go here
    ART_WEB_BOOKMARK = 2,///< A web bookmark. 
    ART_WEB_COOKIE = 3,///< A web cookie. 
    ART_WEB_HISTORY = 4,///< A web history enrty. 
    ART_WEB_DOWNLOAD = 5,///< A web download. 
    ART_RECENT_OBJECT = 6,///< A recently used object (MRU, recent document, etc.).
    ART_GPS_TRACKPOINT = 7,///< A trackpoint from a GPS log.
    ART_INSTALLED_PROG = 8,///< An installed program. 
    ART_KEYWORD_HIT = 9,///< A keyword hit. 
    ART_HASHSET_HIT = 10, ///< A hit within a known bad / notable hashset / hash database. 
    ART_DEVICE_ATTACHED = 11, ///< An event for a device being attached to the host computer
    ART_INTERESTING_FILE_HIT = 12, ///< A file that was flagged because it matched some search criteria for being interesting
    ART_EMAIL_MSG = 13, ///< An e-mail message that was extracted from a file.
    ART_EXTRACTED_TEXT = 14, ///< Text that was extracted from a file.
    ART_WEB_SEARCH_QUERY = 15, ///< Web search engine query extracted from web history.
    ART_METADATA_EXIF = 16, ///< EXIF Metadata
    ART_TAG_FILE = 17, ///< File tags.
    ART_TAG_ARTIFACT = 18, ///< Result tags.
    ART_OS_INFO = 19, ///< Information pertaining to an operating system.
    ART_OS_ACCOUNT = 20, ///< An operating system user account.
    ART_SERVICE_ACCOUNT = 21, ///< A network service user account.
    ART_TOOL_OUTPUT = 22,  ///< Output from an external tool or module (raw text)
    ART_CONTACT = 23, ///< A Contact extracted from a phone, or from an Addressbook/Email/Messaging Application
    ART_MESSAGE = 24, ///< An SMS/MMS message extracted from phone, or from another messaging application, like IM
    ART_CALLLOG = 25, ///< A Phone call log extracted from a phones or softphone application
    ART_CALENDAR_ENTRY = 26, ///< A Calendar entry from a phone, PIM or a Calendar application.
    ART_SPEED_DIAL_ENTRY = 27,  ///< A speed dial entry from a phone 
    ART_BLUETOOTH_PAIRING = 28,  ///< A bluetooth pairing entry
    ART_GPS_BOOKMARK = 29, ///< GPS Bookmarks
    ART_GPS_LAST_KNOWN_LOCATION = 30, ///< GPS Last known location
    ART_GPS_SEARCH = 31,	///< GPS Searches
    ART_PROG_RUN = 32, ///< Application run information
    ART_ENCRYPTION_DETECTED = 33, ///< Encrypted File
    ART_EXT_MISMATCH_DETECTED = 34, ///< Extension Mismatch
    ART_INTERESTING_ARTIFACT_HIT = 35,	///< Any artifact interesting enough that it should be called out in the UI.
    ART_GPS_ROUTE = 36,	///< Route based on GPS coordinates
    ART_REMOTE_DRIVE = 37, ///< Network drive
    ART_FACE_DETECTED = 38, ///< Face detected
    ART_ACCOUNT = 39, ///< An account (e-mail, messaging, credit card...) found on the device
    ART_ENCRYPTION_SUSPECTED = 40, ///< File suspected to be encrypted
    ART_OBJECT_DETECTED = 41, ///< Object detected in an image
    ART_WIFI_NETWORK = 42, ///< A wireless network the device knows about
    ART_DEVICE_INFO = 43, ///< Identifying information about the device (IMEI, IMSI, ICCID)
    ART_SIM_ATTACHED = 44, ///< A SIM card that was attached to the device
    ART_BLUETOOTH_ADAPTER = 45, ///< A bluetooth adapter of the device
    ART_WIFI_NETWORK_ADAPTER = 46, ///< A wireless network adapter of the device
    ART_VERIFICATION_FAILED = 47, ///< A data source failed a verification check
    ART_DATA_SOURCE_USAGE = 48, ///< How a data source was used
    ART_WEB_FORM_AUTOFILL = 49, ///< Web form autofill data
    ART_WEB_FORM_ADDRESS = 50, ///< Address saved by a web form
};

/**
 * Built in attribute types 
 *
 * The numbers are explicitly added to make it easier to verify
 * that they match the ids stored in case databases. Do not renumber.
 */
enum ATTRIBUTE_TYPE {
    ATTR_URL = 1,///< String of a URL, should start with http:// or ftp:// etc.
    ATTR_DATETIME = 2,///< GMT based Unix time
    ATTR_NAME = 3,///< STRING: The name associated with an artifact
    ATTR_PROG_NAME = 4,///< String of name of a program that was installed on the system
    ATTR_VALUE = 6,///< Some value associated with an artifact
    ATTR_FLAG = 7,///< Some flag associated with an artifact
    ATTR_PATH = 8,///< A filesystem path.  Should be fully qualified.
    ATTR_KEYWORD = 10,///< STRING: Keyword that was found in this file. 
    ATTR_KEYWORD_REGEXP = 11,///< STRING: A regular expression string
    ATTR_KEYWORD_PREVIEW = 12,///< STRING: A text preview
    ATTR_USER_NAME = 14,///< String of a user name.
    ATTR_DOMAIN = 15,///< String of a DNS Domain name, e.g. sleuthkit.org
    ATTR_PASSWORD = 16,///< String of a password that was found.
    ATTR_NAME_PERSON = 17,///< String of a person name
    ATTR_DEVICE_MODEL = 18,///< String of model name of a device
    ATTR_DEVICE_MAKE = 19,///< String of make of a device
    ATTR_DEVICE_ID = 20,///< String of ID/serial number of a device
    ATTR_EMAIL = 21,///< String of e-mail address in the form of user@host.com
    ATTR_HASH_MD5 = 22,///< STRING: MD5 hash
    ATTR_HASH_SHA1 = 23,///< STRING: SHA1 hash
    ATTR_HASH_SHA2_256 = 24,///< STRING: SHA2 256 bit hash
    ATTR_HASH_SHA2_512 = 25,///< STRING: SHA2 512 bit hash
    ATTR_TEXT = 26,///< String of text extracted from a file
    ATTR_IP_ADDRESS = 34,///< String of IP Address
    ATTR_PHONE_NUMBER = 35,///< String of phone number
    ATTR_PATH_ID = 36,///< Object ID from database that a ATTR_PATH attribute corresponds to.
    ATTR_SET_NAME = 37,///< STRING: The name of a set that was used to find this artifact
    ATTR_EMAIL_TO = 41, ///< String of an e-mail address that a message is being sent to directly (not cc:).
    ATTR_EMAIL_FROM = 44, ///< String of an e-mail address that a message is being sent from.
    ATTR_DATETIME_RCVD = 50, ///< Time in Unix epoch that something was received.
    ATTR_DATETIME_SENT = 51, ///< Time in Unix epoch that something was sent.
    ATTR_SUBJECT = 52, ///< String of a subject (such as one of an e-mail message)
    ATTR_TITLE = 53, ///< String of a title (such as a webpage or other document)
    ATTR_COMMENT = 66, ///< Comment string.
    ATTR_DATETIME_CREATED = 68,///< Time in Unix epoch that something was created
    ATTR_DESCRIPTION = 73, ///< String for a description associated with an artifact.
    ATTR_MESSAGE_TYPE = 74, ///< SMS or MMS or IM ...
    ATTR_PHONE_NUMBER_HOME = 75, ///< Phone number (Home)
    ATTR_PHONE_NUMBER_OFFICE = 76, ///< Phone number (Office)
    ATTR_PHONE_NUMBER_MOBILE = 77, ///< Phone Number (Mobile)
    ATTR_PHONE_NUMBER_FROM = 78, ///<  Source Phone Number, originating a call or message
    ATTR_PHONE_NUMBER_TO = 79, ///< Destination Phone Number, receiving a call or message
    ATTR_DIRECTION = 80,  ///< Msg/Call direction: incoming, outgoing
    ATTR_DEVICE_NAME = 88, ///< device name - a user assigned (usually) device name
    ATTR_ASSOCIATED_ARTIFACT = 96, ///< Artifact ID of a related artifact
    ATTR_LOCATION = 86, ///< Location string associated with an event
    ATTR_CITY = 117, ///< City name
    ATTR_ACCOUNT_TYPE = 118, ///< Type of an account (e-mail, Facebook, credit card...)
    ATTR_ID = 121, ///< Identifier string
    ATTR_SSID = 122, ///< Name of a wireless network
    ATTR_BSSID = 123, ///< MAC address of a wireless access point
    ATTR_MAC_ADDRESS = 124, ///< MAC address of a network interface
    ATTR_IMEI = 125, ///< International Mobile Equipment Identity
    ATTR_IMSI = 126, ///< International Mobile Subscriber Identity
    ATTR_ICCID = 127, ///< Integrated Circuit Card Identifier of a SIM card
};

/**
 * Class used to store the pair of type and display names of attributes.
 */
class CorrAttributeNames{
public:
    std::string typeName;
    std::string displayName;
    CorrAttributeNames(const std::string &name, const std::string &display):
    typeName(name),
        displayName(display){}
};

/**
 * Class used to store the pair of type and display names of artifacts.
 */
class CorrArtifactNames{
public:
    std::string typeName;
    std::string displayName;
    CorrArtifactNames(const std::string &name, const std::string &display):
    typeName(name),
        displayName(display){}
};

/**
 * Conversions between artifact/attribute type ids and their canonical
 * (TSK_*) and display names. Names are the ones stored in case databases,
 * so case files can refer to types by name.
 */
class CORR_API CorrBlackboard
{
public:
    /**
    * Convert attribute type id to display name
    * @param attributeTypeID attribute type id
    * @returns display name
    * @throws CorrNotFoundException if no type exists for that id
    */
    static std::string attrTypeIDToTypeDisplayName(const int attributeTypeID);
    /**
    * Convert attribute type name to id
    * @param attributeTypeString attribute type name
    * @returns attribute type id
    * @throws CorrNotFoundException if no type exists with that name
    */
    static int attrTypeNameToTypeID(const std::string& attributeTypeString);
    /**
    * Convert attribute type id to name
    * @param attributeTypeID id
    * @returns attribute type name
    * @throws CorrNotFoundException if no type exists with that id
    */
    static std::string attrTypeIDToTypeName(const int attributeTypeID);
    /**
    * Convert artifact type id to display name
    * @param artifactTypeID artifact type id
    * @returns display name
    * @throws CorrNotFoundException if no type exists with that id
    */
    static std::string artTypeIDToDisplayName(const int artifactTypeID);
    /**
    * Convert artifact type name to id
    * @param artifactTypeString artifact type name
    * @returns artifact type id
    * @throws CorrNotFoundException if no type exists with that name
    */
    static int artTypeNameToTypeID(const std::string& artifactTypeString);
    /**
    * Convert artifact type id to name
    * @param artifactTypeID artifact type id
    * @returns artifact type name
    * @throws CorrNotFoundException if no type exists with that id
    */
    static std::string artTypeIDToTypeName(const int artifactTypeID);

    static std::map<int, CorrArtifactNames> getAllArtifactTypes();
    static std::map<int, CorrAttributeNames> getAllAttributeTypes();
};

#endif
