/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "arx/services/ArxConfig.h"
#include "arx/utilities/ArxException.h"

#include "catch.hpp"
#include "runner.h"

TEST_CASE("config defaults", "[config]") {
  ArxConfigLoader loader;
  loader.set(ArxConfigLoader::OUT_DIR, "/cases/1");
  loader.set(ArxConfigLoader::CONFIG_DIR, "/etc/arx");
  ArxConfig config = loader.build();

  CHECK(config.outDir == "/cases/1");
  CHECK(config.databasePath == "/cases/1/arx.db");
  CHECK(config.logFile == "/cases/1/logs/arx.log");
  CHECK(config.patternFile == "/etc/arx/artifact_patterns.xml");
  CHECK(config.pipelineFile == "/etc/arx/pipeline_config.xml");
  CHECK(config.extractionWorkers == 4);
  CHECK(config.copyBufferSize == 65536);
  CHECK(config.useFileIndex);
  CHECK(config.replaceScope == ArxConfig::REPLACE_BY_EXTRACTOR);
  CHECK(config.toolTimeoutSeconds == 0);
  CHECK(config.toolDir("scalpel") == "");
  CHECK(config.scalpelConfigFile == "");
}

TEST_CASE("config file with macros and tools", "[config]") {
  runner::tempdir dir("arx_config");
  runner::write_file(dir.path / "arx_config.xml",
    "<ARX_CONFIG>\n"
    "  <OUT_DIR>/cases/42/output</OUT_DIR>\n"
    "  <DB_PATH>#OUT_DIR#/store/arx.db</DB_PATH>\n"
    "  <EXTRACTION_WORKERS>8</EXTRACTION_WORKERS>\n"
    "  <USE_FILE_INDEX>false</USE_FILE_INDEX>\n"
    "  <REPLACE_SCOPE>Run</REPLACE_SCOPE>\n"
    "  <TOOLS>\n"
    "    <SCALPEL_DIR>/opt/scalpel</SCALPEL_DIR>\n"
    "  </TOOLS>\n"
    "</ARX_CONFIG>\n");

  ArxConfigLoader loader;
  loader.set(ArxConfigLoader::EXTRACTION_WORKERS, "2");
  loader.loadFile((dir.path / "arx_config.xml").string());
  ArxConfig config = loader.build();

  CHECK(config.outDir == "/cases/42/output");
  CHECK(config.databasePath == "/cases/42/output/store/arx.db");
  // Programmatic values win over the file.
  CHECK(config.extractionWorkers == 2);
  CHECK_FALSE(config.useFileIndex);
  CHECK(config.replaceScope == ArxConfig::REPLACE_BY_RUN);
  CHECK(config.toolDir("SCALPEL") == "/opt/scalpel");
  CHECK(config.scalpelConfigFile == "/opt/scalpel/scalpel.conf");
  CHECK(config.configDir == dir.str());
  CHECK(loader.expandMacros("#OUT_DIR#/x #not a macro#") == "/cases/42/output/x #not a macro#");
}

TEST_CASE("config validation errors", "[config]") {
  SECTION("missing out dir") {
    ArxConfigLoader loader;
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
  }
  SECTION("worker count out of range") {
    ArxConfigLoader loader;
    loader.set(ArxConfigLoader::OUT_DIR, "/cases/1");
    loader.set(ArxConfigLoader::EXTRACTION_WORKERS, "0");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
    loader.set(ArxConfigLoader::EXTRACTION_WORKERS, "65");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
    loader.set(ArxConfigLoader::EXTRACTION_WORKERS, "four");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
  }
  SECTION("unknown replace scope") {
    ArxConfigLoader loader;
    loader.set(ArxConfigLoader::OUT_DIR, "/cases/1");
    loader.set(ArxConfigLoader::REPLACE_SCOPE, "evidence");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
  }
  SECTION("self referencing macro") {
    ArxConfigLoader loader;
    loader.set(ArxConfigLoader::OUT_DIR, "#OUT_DIR#");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
  }
  SECTION("missing file") {
    ArxConfigLoader loader;
    CHECK_THROWS_AS(loader.loadFile("/nonexistent/arx_config.xml"), ArxConfigurationException);
  }
  SECTION("badly named tool") {
    ArxConfigLoader loader;
    loader.set(ArxConfigLoader::OUT_DIR, "/cases/1");
    loader.set("TOOLS.SCALPEL", "/opt/scalpel");
    CHECK_THROWS_AS(loader.build(), ArxConfigurationException);
  }
}
