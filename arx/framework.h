/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _ARX_FRAMEWORK_H
#define _ARX_FRAMEWORK_H

/**
 * Include this file when incorporating the extraction engine into an
 * application.
 */

#include "arx/framework_i.h"
#include "arx/ArxVersionInfo.h"

#include "arx/services/ArxServices.h"
#include "arx/services/Log.h"
#include "arx/services/ArxConfig.h"
#include "arx/services/ArxImgDB.h"
#include "arx/services/ArxImgDBSqlite.h"
#include "arx/utilities/ArxException.h"
#include "arx/utilities/ArxUtilities.h"
#include "arx/utilities/ArxTimestamps.h"
#include "arx/utilities/ArxHashCalculator.h"
#include "arx/utilities/ArxCancellationToken.h"
#include "arx/fs/ArxEvidenceFS.h"
#include "arx/fs/ArxEvidenceFSDirectory.h"
#include "arx/fs/ArxEvidenceFSTsk.h"
#include "arx/records/ArxRecords.h"
#include "arx/discovery/ArxPatternSet.h"
#include "arx/discovery/ArxDiscovery.h"
#include "arx/discovery/ArxFileIndexBuilder.h"
#include "arx/discovery/ArxBodyfileImporter.h"
#include "arx/extraction/ArxManifest.h"
#include "arx/extraction/ArxStagingEngine.h"
#include "arx/extraction/ArxCarveExtractScalpel.h"
#include "arx/parsers/ArxParser.h"
#include "arx/parsers/ArxParserRegistry.h"
#include "arx/ingestion/ArxIngestionEngine.h"
#include "arx/run/ArxRunTracker.h"
#include "arx/run/ArxToolRunner.h"
#include "arx/pipeline/ArxPipeline.h"

#endif
