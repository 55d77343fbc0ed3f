#pragma once

int cmd_export(int argc, char** argv);
