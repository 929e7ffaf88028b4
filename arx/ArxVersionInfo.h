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
 * \file ArxVersionInfo.h
 * Version of the artifact extraction framework.
 */
#ifndef _ARX_VERSIONINFO_H
#define _ARX_VERSIONINFO_H

/**
 * Version of the framework in hex: 0xMMmmrr00
 */
#define ARX_FRAMEWORK_VERSION_NUM 0x01000000

#define ARX_FRAMEWORK_VERSION_STR "1.0.0"

#endif
