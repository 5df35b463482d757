#pragma once

int cmd_schema(int argc, char** argv);
int cmd_kinds(int argc, char** argv);
