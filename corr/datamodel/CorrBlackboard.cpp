/*
* The Sleuth Kit
*
* Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
* Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
* reserved.
*
* This software is distributed under the Common Public License 1.0
*/

#include "CorrBlackboard.h"
#include "corr/utilities/CorrException.h"

#include <sstream>

using namespace std;

namespace
{
map<int, CorrArtifactNames> initializeArtifactTypeMap(){
    map<int, CorrArtifactNames> retval;
    retval.insert(pair<int, CorrArtifactNames>(ART_GEN_INFO, CorrArtifactNames("TSK_GEN_INFO", "General Info")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_BOOKMARK, CorrArtifactNames("TSK_WEB_BOOKMARK", "Web Bookmarks")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_COOKIE, CorrArtifactNames("TSK_WEB_COOKIE", "Web Cookies")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_HISTORY, CorrArtifactNames("TSK_WEB_HISTORY", "Web History")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_DOWNLOAD, CorrArtifactNames("TSK_WEB_DOWNLOAD", "Web Downloads")));
    retval.insert(pair<int, CorrArtifactNames>(ART_RECENT_OBJECT, CorrArtifactNames("TSK_RECENT_OBJECT", "Recent History Object")));
    retval.insert(pair<int, CorrArtifactNames>(ART_GPS_TRACKPOINT, CorrArtifactNames("TSK_GPS_TRACKPOINT", "GPS Trackpoints")));
    retval.insert(pair<int, CorrArtifactNames>(ART_INSTALLED_PROG, CorrArtifactNames("TSK_INSTALLED_PROG", "Installed Programs")));
    retval.insert(pair<int, CorrArtifactNames>(ART_KEYWORD_HIT, CorrArtifactNames("TSK_KEYWORD_HIT", "Keyword Hits")));
    retval.insert(pair<int, CorrArtifactNames>(ART_HASHSET_HIT, CorrArtifactNames("TSK_HASHSET_HIT", "Hashset Hits")));
    retval.insert(pair<int, CorrArtifactNames>(ART_DEVICE_ATTACHED, CorrArtifactNames("TSK_DEVICE_ATTACHED", "Devices Attached")));
    retval.insert(pair<int, CorrArtifactNames>(ART_INTERESTING_FILE_HIT, CorrArtifactNames("TSK_INTERESTING_FILE_HIT", "Interesting Files")));
    retval.insert(pair<int, CorrArtifactNames>(ART_EMAIL_MSG, CorrArtifactNames("TSK_EMAIL_MSG", "E-Mail Messages")));
    retval.insert(pair<int, CorrArtifactNames>(ART_EXTRACTED_TEXT, CorrArtifactNames("TSK_EXTRACTED_TEXT", "Extracted Text")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_SEARCH_QUERY, CorrArtifactNames("TSK_WEB_SEARCH_QUERY", "Web Search")));
    retval.insert(pair<int, CorrArtifactNames>(ART_METADATA_EXIF, CorrArtifactNames("TSK_METADATA_EXIF", "EXIF Metadata")));
    retval.insert(pair<int, CorrArtifactNames>(ART_TAG_FILE, CorrArtifactNames("TSK_TAG_FILE", "Tagged Files")));
    retval.insert(pair<int, CorrArtifactNames>(ART_TAG_ARTIFACT, CorrArtifactNames("TSK_TAG_ARTIFACT", "Tagged Results")));
    retval.insert(pair<int, CorrArtifactNames>(ART_OS_INFO, CorrArtifactNames("TSK_OS_INFO", "Operating System Information")));
    retval.insert(pair<int, CorrArtifactNames>(ART_OS_ACCOUNT, CorrArtifactNames("TSK_OS_ACCOUNT", "Operating System User Account")));
    retval.insert(pair<int, CorrArtifactNames>(ART_SERVICE_ACCOUNT, CorrArtifactNames("TSK_SERVICE_ACCOUNT", "Web Accounts")));
    retval.insert(pair<int, CorrArtifactNames>(ART_TOOL_OUTPUT, CorrArtifactNames("TSK_TOOL_OUTPUT", "Raw Tool Output")));
    retval.insert(pair<int, CorrArtifactNames>(ART_CONTACT, CorrArtifactNames("TSK_CONTACT", "Contacts")));
    retval.insert(pair<int, CorrArtifactNames>(ART_MESSAGE, CorrArtifactNames("TSK_MESSAGE", "Messages")));
    retval.insert(pair<int, CorrArtifactNames>(ART_CALLLOG, CorrArtifactNames("TSK_CALLLOG", "Call Logs")));
    retval.insert(pair<int, CorrArtifactNames>(ART_CALENDAR_ENTRY, CorrArtifactNames("TSK_CALENDAR_ENTRY", "Calendar Entries")));
    retval.insert(pair<int, CorrArtifactNames>(ART_SPEED_DIAL_ENTRY, CorrArtifactNames("TSK_SPEED_DIAL_ENTRY", "Speed Dial Entries")));
    retval.insert(pair<int, CorrArtifactNames>(ART_BLUETOOTH_PAIRING, CorrArtifactNames("TSK_BLUETOOTH_PAIRING", "Bluetooth Pairings")));
    retval.insert(pair<int, CorrArtifactNames>(ART_GPS_BOOKMARK, CorrArtifactNames("TSK_GPS_BOOKMARK", "GPS Bookmarks")));
    retval.insert(pair<int, CorrArtifactNames>(ART_GPS_LAST_KNOWN_LOCATION, CorrArtifactNames("TSK_GPS_LAST_KNOWN_LOCATION", "GPS Last Known Location")));
    retval.insert(pair<int, CorrArtifactNames>(ART_GPS_SEARCH, CorrArtifactNames("TSK_GPS_SEARCH", "GPS Searches")));
    retval.insert(pair<int, CorrArtifactNames>(ART_PROG_RUN, CorrArtifactNames("TSK_PROG_RUN", "Run Programs")));
    retval.insert(pair<int, CorrArtifactNames>(ART_ENCRYPTION_DETECTED, CorrArtifactNames("TSK_ENCRYPTION_DETECTED", "Encryption Detected")));
    retval.insert(pair<int, CorrArtifactNames>(ART_EXT_MISMATCH_DETECTED, CorrArtifactNames("TSK_EXT_MISMATCH_DETECTED", "Extension Mismatch Detected")));
    retval.insert(pair<int, CorrArtifactNames>(ART_INTERESTING_ARTIFACT_HIT, CorrArtifactNames("TSK_INTERESTING_ARTIFACT_HIT", "Interesting Results")));
    retval.insert(pair<int, CorrArtifactNames>(ART_GPS_ROUTE, CorrArtifactNames("TSK_GPS_ROUTE", "GPS Route")));
    retval.insert(pair<int, CorrArtifactNames>(ART_REMOTE_DRIVE, CorrArtifactNames("TSK_REMOTE_DRIVE", "Remote Drive")));
    retval.insert(pair<int, CorrArtifactNames>(ART_FACE_DETECTED, CorrArtifactNames("TSK_FACE_DETECTED", "Face Detected")));
    retval.insert(pair<int, CorrArtifactNames>(ART_ACCOUNT, CorrArtifactNames("TSK_ACCOUNT", "Accounts")));
    retval.insert(pair<int, CorrArtifactNames>(ART_ENCRYPTION_SUSPECTED, CorrArtifactNames("TSK_ENCRYPTION_SUSPECTED", "Encryption Suspected")));
    retval.insert(pair<int, CorrArtifactNames>(ART_OBJECT_DETECTED, CorrArtifactNames("TSK_OBJECT_DETECTED", "Object Detected")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WIFI_NETWORK, CorrArtifactNames("TSK_WIFI_NETWORK", "Wireless Networks")));
    retval.insert(pair<int, CorrArtifactNames>(ART_DEVICE_INFO, CorrArtifactNames("TSK_DEVICE_INFO", "Device Info")));
    retval.insert(pair<int, CorrArtifactNames>(ART_SIM_ATTACHED, CorrArtifactNames("TSK_SIM_ATTACHED", "SIM Attached")));
    retval.insert(pair<int, CorrArtifactNames>(ART_BLUETOOTH_ADAPTER, CorrArtifactNames("TSK_BLUETOOTH_ADAPTER", "Bluetooth Adapter")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WIFI_NETWORK_ADAPTER, CorrArtifactNames("TSK_WIFI_NETWORK_ADAPTER", "Wireless Network Adapters")));
    retval.insert(pair<int, CorrArtifactNames>(ART_VERIFICATION_FAILED, CorrArtifactNames("TSK_VERIFICATION_FAILED", "Verification Failure")));
    retval.insert(pair<int, CorrArtifactNames>(ART_DATA_SOURCE_USAGE, CorrArtifactNames("TSK_DATA_SOURCE_USAGE", "Data Source Usage")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_FORM_AUTOFILL, CorrArtifactNames("TSK_WEB_FORM_AUTOFILL", "Web Form Autofill")));
    retval.insert(pair<int, CorrArtifactNames>(ART_WEB_FORM_ADDRESS, CorrArtifactNames("TSK_WEB_FORM_ADDRESS", "Web Form Addresses")));

    return retval;
}

map<int, CorrAttributeNames> initializeAttributeTypeMap(){
    map<int, CorrAttributeNames> retval;
    retval.insert(pair<int, CorrAttributeNames>(ATTR_URL, CorrAttributeNames("TSK_URL", "URL")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DATETIME, CorrAttributeNames("TSK_DATETIME", "Date/Time")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_NAME, CorrAttributeNames("TSK_NAME", "Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PROG_NAME, CorrAttributeNames("TSK_PROG_NAME", "Program Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_VALUE, CorrAttributeNames("TSK_VALUE", "Value")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_FLAG, CorrAttributeNames("TSK_FLAG", "Flag")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PATH, CorrAttributeNames("TSK_PATH", "Path")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_KEYWORD, CorrAttributeNames("TSK_KEYWORD", "Keyword")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_KEYWORD_REGEXP, CorrAttributeNames("TSK_KEYWORD_REGEXP", "Keyword Regular Expression")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_KEYWORD_PREVIEW, CorrAttributeNames("TSK_KEYWORD_PREVIEW", "Keyword Preview")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_USER_NAME, CorrAttributeNames("TSK_USER_NAME", "User Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DOMAIN, CorrAttributeNames("TSK_DOMAIN", "Domain")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PASSWORD, CorrAttributeNames("TSK_PASSWORD", "Password")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_NAME_PERSON, CorrAttributeNames("TSK_NAME_PERSON", "Person Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DEVICE_MODEL, CorrAttributeNames("TSK_DEVICE_MODEL", "Device Model")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DEVICE_MAKE, CorrAttributeNames("TSK_DEVICE_MAKE", "Device Make")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DEVICE_ID, CorrAttributeNames("TSK_DEVICE_ID", "Device ID")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_EMAIL, CorrAttributeNames("TSK_EMAIL", "Email")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_HASH_MD5, CorrAttributeNames("TSK_HASH_MD5", "MD5 Hash")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_HASH_SHA1, CorrAttributeNames("TSK_HASH_SHA1", "SHA1 Hash")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_HASH_SHA2_256, CorrAttributeNames("TSK_HASH_SHA2_256", "SHA2-256 Hash")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_HASH_SHA2_512, CorrAttributeNames("TSK_HASH_SHA2_512", "SHA2-512 Hash")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_TEXT, CorrAttributeNames("TSK_TEXT", "Text")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_IP_ADDRESS, CorrAttributeNames("TSK_IP_ADDRESS", "IP Address")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER, CorrAttributeNames("TSK_PHONE_NUMBER", "Phone Number")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PATH_ID, CorrAttributeNames("TSK_PATH_ID", "Path ID")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_SET_NAME, CorrAttributeNames("TSK_SET_NAME", "Set Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_EMAIL_TO, CorrAttributeNames("TSK_EMAIL_TO", "E-Mail To")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_EMAIL_FROM, CorrAttributeNames("TSK_EMAIL_FROM", "E-Mail From")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DATETIME_RCVD, CorrAttributeNames("TSK_DATETIME_RCVD", "Date Received")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DATETIME_SENT, CorrAttributeNames("TSK_DATETIME_SENT", "Date Sent")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_SUBJECT, CorrAttributeNames("TSK_SUBJECT", "Subject")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_TITLE, CorrAttributeNames("TSK_TITLE", "Title")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_COMMENT, CorrAttributeNames("TSK_COMMENT", "Comment")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DATETIME_CREATED, CorrAttributeNames("TSK_DATETIME_CREATED", "Date Created")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DESCRIPTION, CorrAttributeNames("TSK_DESCRIPTION", "Description")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_MESSAGE_TYPE, CorrAttributeNames("TSK_MESSAGE_TYPE", "Message Type")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER_HOME, CorrAttributeNames("TSK_PHONE_NUMBER_HOME", "Phone Number (Home)")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER_OFFICE, CorrAttributeNames("TSK_PHONE_NUMBER_OFFICE", "Phone Number (Office)")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER_MOBILE, CorrAttributeNames("TSK_PHONE_NUMBER_MOBILE", "Phone Number (Mobile)")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER_FROM, CorrAttributeNames("TSK_PHONE_NUMBER_FROM", "From Phone Number")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_PHONE_NUMBER_TO, CorrAttributeNames("TSK_PHONE_NUMBER_TO", "To Phone Number")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DIRECTION, CorrAttributeNames("TSK_DIRECTION", "Direction")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_DEVICE_NAME, CorrAttributeNames("TSK_DEVICE_NAME", "Name")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_ASSOCIATED_ARTIFACT, CorrAttributeNames("TSK_ASSOCIATED_ARTIFACT", "Associated Artifact")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_LOCATION, CorrAttributeNames("TSK_LOCATION", "Location")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_CITY, CorrAttributeNames("TSK_CITY", "City")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_ACCOUNT_TYPE, CorrAttributeNames("TSK_ACCOUNT_TYPE", "Account Type")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_ID, CorrAttributeNames("TSK_ID", "ID")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_SSID, CorrAttributeNames("TSK_SSID", "SSID")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_BSSID, CorrAttributeNames("TSK_BSSID", "BSSID")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_MAC_ADDRESS, CorrAttributeNames("TSK_MAC_ADDRESS", "MAC Address")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_IMEI, CorrAttributeNames("TSK_IMEI", "IMEI")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_IMSI, CorrAttributeNames("TSK_IMSI", "IMSI")));
    retval.insert(pair<int, CorrAttributeNames>(ATTR_ICCID, CorrAttributeNames("TSK_ICCID", "ICCID")));

    return retval;
}

const map<int, CorrArtifactNames> artifact_type_table = initializeArtifactTypeMap();
const map<int, CorrAttributeNames> attribute_type_table = initializeAttributeTypeMap();

void throwNoSuchType(const char *kind, const string &key)
{
    stringstream msg;
    msg << "No " << kind << " type with " << key;
    throw CorrNotFoundException(msg.str());
}

string idKey(int id)
{
    stringstream key;
    key << "id " << id;
    return key.str();
}
}

string CorrBlackboard::attrTypeIDToTypeDisplayName(const int attributeTypeID){
    map<int, CorrAttributeNames>::const_iterator it = attribute_type_table.find(attributeTypeID);
    if(it == attribute_type_table.end())
        throwNoSuchType("attribute", idKey(attributeTypeID));
    return it->second.displayName;
}

int CorrBlackboard::attrTypeNameToTypeID(const string& attributeTypeString){
    for (map<int, CorrAttributeNames>::const_iterator it = attribute_type_table.begin(); it != attribute_type_table.end(); ++it){
        if(attributeTypeString == it->second.typeName)
            return it->first;
    }
    throwNoSuchType("attribute", "name " + attributeTypeString);
    return 0;
}

string CorrBlackboard::attrTypeIDToTypeName(const int attributeTypeID){
    map<int, CorrAttributeNames>::const_iterator it = attribute_type_table.find(attributeTypeID);
    if(it == attribute_type_table.end())
        throwNoSuchType("attribute", idKey(attributeTypeID));
    return it->second.typeName;
}

string CorrBlackboard::artTypeIDToDisplayName(const int artifactTypeID){
    map<int, CorrArtifactNames>::const_iterator it = artifact_type_table.find(artifactTypeID);
    if(it == artifact_type_table.end())
        throwNoSuchType("artifact", idKey(artifactTypeID));
    return it->second.displayName;
}

int CorrBlackboard::artTypeNameToTypeID(const string& artifactTypeString){
    for (map<int, CorrArtifactNames>::const_iterator it = artifact_type_table.begin(); it != artifact_type_table.end(); ++it){
        if(artifactTypeString == it->second.typeName)
            return it->first;
    }
    throwNoSuchType("artifact", "name " + artifactTypeString);
    return 0;
}

string CorrBlackboard::artTypeIDToTypeName(const int artifactTypeID){
    map<int, CorrArtifactNames>::const_iterator it = artifact_type_table.find(artifactTypeID);
    if(it == artifact_type_table.end())
        throwNoSuchType("artifact", idKey(artifactTypeID));
    return it->second.typeName;
}

map<int, CorrArtifactNames> CorrBlackboard::getAllArtifactTypes(){
    return artifact_type_table;
}

map<int, CorrAttributeNames> CorrBlackboard::getAllAttributeTypes(){
    return attribute_type_table;
}
